#include "dsync/remote/types.hpp"

namespace dsync::remote {

const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::File: return "file";
        case NodeKind::Folder: return "folder";
    }
    return "unknown";
}

const char* to_string(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::Retriable: return "retriable";
        case ErrorClass::Permanent: return "permanent";
    }
    return "unknown";
}

} // namespace dsync::remote
