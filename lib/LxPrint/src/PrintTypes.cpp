#include "PrintTypes.hpp"

const char* printErrorString(PrintError error) {
    switch (error) {
        case PrintError::None: return "None";
        case PrintError::EncodingError: return "EncodingError";
        case PrintError::DecodeError: return "DecodeError";
        case PrintError::TransportError: return "TransportError";
        case PrintError::JobTimeout: return "JobTimeout";
        case PrintError::Cancelled: return "Cancelled";
        case PrintError::ImageTooLarge: return "ImageTooLarge";
        case PrintError::JobInProgress: return "JobInProgress";
        case PrintError::EmptyImage: return "EmptyImage";
        default: return "Unknown";
    }
}

const char* decodeErrorString(DecodeError error) {
    switch (error) {
        case DecodeError::None: return "None";
        case DecodeError::BadLength: return "BadLength";
        case DecodeError::BadMarker: return "BadMarker";
        case DecodeError::UnknownOpcode: return "UnknownOpcode";
        default: return "Unknown";
    }
}
