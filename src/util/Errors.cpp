#include "vaulttrade/util/Errors.hpp"

namespace vaulttrade::util {

std::string_view toString(ErrorClass errorClass) noexcept {
    switch (errorClass) {
    case ErrorClass::none: return "none";
    case ErrorClass::validation: return "validation";
    case ErrorClass::authorization: return "authorization";
    case ErrorClass::insufficientResource: return "insufficientResource";
    case ErrorClass::transportAmbiguity: return "transportAmbiguity";
    case ErrorClass::unrecoveredInconsistency: return "unrecoveredInconsistency";
    case ErrorClass::internal: return "internal";
    }
    return "internal";
}

std::optional<ErrorClass> parseErrorClass(std::string_view text) {
    if (text == "none") return ErrorClass::none;
    if (text == "validation") return ErrorClass::validation;
    if (text == "authorization") return ErrorClass::authorization;
    if (text == "insufficientResource") return ErrorClass::insufficientResource;
    if (text == "transportAmbiguity") return ErrorClass::transportAmbiguity;
    if (text == "unrecoveredInconsistency") return ErrorClass::unrecoveredInconsistency;
    if (text == "internal") return ErrorClass::internal;
    return std::nullopt;
}

} // namespace vaulttrade::util
