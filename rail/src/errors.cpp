#include "errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unreachable:         return "Unreachable";
        case ErrorKind::Timeout:             return "Timeout";
        case ErrorKind::ChainMismatch:       return "ChainMismatch";
        case ErrorKind::MalformedResponse:   return "MalformedResponse";
        case ErrorKind::CallFailed:          return "CallFailed";
        case ErrorKind::NoRpcConfigured:     return "NoRpcConfigured";
        case ErrorKind::NoPrimaryConfigured: return "NoPrimaryConfigured";
        case ErrorKind::NoBackupsAvailable:  return "NoBackupsAvailable";
        case ErrorKind::PoolFull:            return "PoolFull";
        case ErrorKind::DuplicateEndpoint:   return "DuplicateEndpoint";
        case ErrorKind::UnknownEndpoint:     return "UnknownEndpoint";
        case ErrorKind::AllEndpointsFailed:  return "AllEndpointsFailed";
        case ErrorKind::RegistryUnavailable: return "RegistryUnavailable";
        case ErrorKind::InvalidArgument:     return "InvalidArgument";
    }
    return "Unknown";
}

int error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unreachable:         return 1001;
        case ErrorKind::ChainMismatch:       return 1002;
        case ErrorKind::AllEndpointsFailed:  return 1003;
        case ErrorKind::Timeout:             return 1004;
        case ErrorKind::MalformedResponse:   return 1005;
        case ErrorKind::NoRpcConfigured:     return 1006;
        case ErrorKind::NoPrimaryConfigured: return 1007;
        case ErrorKind::NoBackupsAvailable:  return 1008;
        case ErrorKind::PoolFull:            return 1009;
        case ErrorKind::DuplicateEndpoint:   return 1010;
        case ErrorKind::UnknownEndpoint:     return 1011;
        case ErrorKind::RegistryUnavailable: return 1012;
        case ErrorKind::InvalidArgument:     return 2006;
        case ErrorKind::CallFailed:          return 3003;
    }
    return 0;
}

bool is_endpoint_fault(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unreachable:
        case ErrorKind::Timeout:
        case ErrorKind::ChainMismatch:
        case ErrorKind::MalformedResponse:
        case ErrorKind::CallFailed:
            return true;
        default:
            return false;
    }
}

RailError make_error(ErrorKind kind, const std::string& message) {
    RailError err;
    err.kind = kind;
    err.message = message.empty() ? to_string(kind) : message;
    return err;
}
