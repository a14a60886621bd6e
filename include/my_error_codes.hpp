#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
}  // namespace GENERAL

namespace CONFIG {  // Configuration errors

constexpr int INVALID_VALUE = 5301;  // Configuration value has the wrong type
constexpr int UNKNOWN_KEY = 5302;  // Unknown configuration key
}  // namespace CONFIG

namespace TOKEN {  // R-Auth token errors

constexpr int MALFORMED_BASE64 = 6100;  // Token is not valid standard base64
constexpr int TOO_SHORT = 6101;  // Token shorter than seed plus one byte
constexpr int FIELD_COUNT = 6102;  // Payload does not hold exactly 8 fields
constexpr int BAD_TIMESTAMP = 6103;  // Timestamp field is not an int32
}  // namespace TOKEN

}  // namespace my_errors
