#pragma once

namespace mirror {

enum class StatusCode {
    Ok = 0,
    AlreadyExists,
    NotFound,
    InvalidArgument,
    CapacityExceeded,
    InternalError,
    AssertionFailed
};

}
