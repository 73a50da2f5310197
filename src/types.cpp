#include "types.h"

namespace eqjoin {

const char* type_name(TypeId type) {
    switch (type) {
        case TypeId::INT64: return "INT64";
        case TypeId::DOUBLE: return "DOUBLE";
        case TypeId::STRING: return "STRING";
        case TypeId::DATE32: return "DATE32";
        case TypeId::TEXT: return "TEXT";
    }
    return "UNKNOWN";
}

} // namespace eqjoin
