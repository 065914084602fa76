#include "core/DataValue.h"
#include <sstream>
#include <stdexcept>

namespace opcuasub {

DataValue::DataValue() {
    UA_DataValue_init(&value_);
}

DataValue::DataValue(const UA_DataValue& value) {
    UA_DataValue_init(&value_);
    UA_StatusCode status = UA_DataValue_copy(&value, &value_);
    if (status != UA_STATUSCODE_GOOD) {
        throw std::runtime_error("Failed to copy DataValue: " + statusCodeToString(status));
    }
}

DataValue::~DataValue() {
    UA_DataValue_clear(&value_);
}

DataValue::DataValue(const DataValue& other)
    : DataValue(other.value_) {
}

DataValue& DataValue::operator=(const DataValue& other) {
    if (this != &other) {
        DataValue copy(other);
        *this = std::move(copy);
    }
    return *this;
}

DataValue::DataValue(DataValue&& other) noexcept
    : value_(other.value_) {
    UA_DataValue_init(&other.value_);
}

DataValue& DataValue::operator=(DataValue&& other) noexcept {
    if (this != &other) {
        UA_DataValue_clear(&value_);
        value_ = other.value_;
        UA_DataValue_init(&other.value_);
    }
    return *this;
}

DataValue DataValue::fromStatus(UA_StatusCode status, UA_DateTime serverTimestamp) {
    DataValue result;
    result.setStatus(status);
    if (serverTimestamp != 0) {
        result.setServerTimestamp(serverTimestamp);
    }
    return result;
}

DataValue DataValue::fromScalar(const void* data, const UA_DataType* type,
                                UA_DateTime sourceTimestamp) {
    DataValue result;
    UA_StatusCode status = UA_Variant_setScalarCopy(&result.value_.value, data, type);
    if (status != UA_STATUSCODE_GOOD) {
        throw std::runtime_error("Failed to set scalar value: " + statusCodeToString(status));
    }
    result.value_.hasValue = true;
    if (sourceTimestamp != 0) {
        result.setSourceTimestamp(sourceTimestamp);
    }
    return result;
}

DataValue DataValue::fromDouble(UA_Double value, UA_DateTime sourceTimestamp) {
    return fromScalar(&value, &UA_TYPES[UA_TYPES_DOUBLE], sourceTimestamp);
}

DataValue DataValue::fromInt32(UA_Int32 value, UA_DateTime sourceTimestamp) {
    return fromScalar(&value, &UA_TYPES[UA_TYPES_INT32], sourceTimestamp);
}

DataValue DataValue::fromString(const std::string& value, UA_DateTime sourceTimestamp) {
    UA_String uaString = UA_STRING_ALLOC(value.c_str());
    DataValue result = fromScalar(&uaString, &UA_TYPES[UA_TYPES_STRING], sourceTimestamp);
    UA_String_clear(&uaString);
    return result;
}

UA_StatusCode DataValue::status() const {
    return value_.hasStatus ? value_.status : UA_STATUSCODE_GOOD;
}

void DataValue::setStatus(UA_StatusCode status) {
    value_.status = status;
    value_.hasStatus = (status != UA_STATUSCODE_GOOD);
}

UA_DateTime DataValue::sourceTimestamp() const {
    return value_.hasSourceTimestamp ? value_.sourceTimestamp : 0;
}

UA_DateTime DataValue::serverTimestamp() const {
    return value_.hasServerTimestamp ? value_.serverTimestamp : 0;
}

void DataValue::setSourceTimestamp(UA_DateTime timestamp) {
    value_.sourceTimestamp = timestamp;
    value_.hasSourceTimestamp = true;
}

void DataValue::setServerTimestamp(UA_DateTime timestamp) {
    value_.serverTimestamp = timestamp;
    value_.hasServerTimestamp = true;
}

std::optional<double> DataValue::numericValue() const {
    const UA_Variant& variant = value_.value;
    if (!value_.hasValue || UA_Variant_isEmpty(&variant) || !UA_Variant_isScalar(&variant)) {
        return std::nullopt;
    }

    const UA_DataType* type = variant.type;
    if (type == &UA_TYPES[UA_TYPES_DOUBLE]) {
        return *static_cast<const UA_Double*>(variant.data);
    } else if (type == &UA_TYPES[UA_TYPES_FLOAT]) {
        return *static_cast<const UA_Float*>(variant.data);
    } else if (type == &UA_TYPES[UA_TYPES_INT32]) {
        return *static_cast<const UA_Int32*>(variant.data);
    } else if (type == &UA_TYPES[UA_TYPES_UINT32]) {
        return *static_cast<const UA_UInt32*>(variant.data);
    } else if (type == &UA_TYPES[UA_TYPES_INT64]) {
        return static_cast<double>(*static_cast<const UA_Int64*>(variant.data));
    } else if (type == &UA_TYPES[UA_TYPES_UINT64]) {
        return static_cast<double>(*static_cast<const UA_UInt64*>(variant.data));
    } else if (type == &UA_TYPES[UA_TYPES_INT16]) {
        return *static_cast<const UA_Int16*>(variant.data);
    } else if (type == &UA_TYPES[UA_TYPES_UINT16]) {
        return *static_cast<const UA_UInt16*>(variant.data);
    } else if (type == &UA_TYPES[UA_TYPES_SBYTE]) {
        return *static_cast<const UA_SByte*>(variant.data);
    } else if (type == &UA_TYPES[UA_TYPES_BYTE]) {
        return *static_cast<const UA_Byte*>(variant.data);
    }

    return std::nullopt;
}

bool DataValue::sameValue(const DataValue& other) const {
    if (value_.hasValue != other.value_.hasValue) {
        return false;
    }
    if (!value_.hasValue) {
        return true;
    }
    return UA_order(&value_.value, &other.value_.value, &UA_TYPES[UA_TYPES_VARIANT]) == UA_ORDER_EQ;
}

void DataValue::applyTimestampsToReturn(UA_TimestampsToReturn timestampsToReturn, UA_DateTime now) {
    bool keepSource = (timestampsToReturn == UA_TIMESTAMPSTORETURN_SOURCE ||
                       timestampsToReturn == UA_TIMESTAMPSTORETURN_BOTH);
    bool keepServer = (timestampsToReturn == UA_TIMESTAMPSTORETURN_SERVER ||
                       timestampsToReturn == UA_TIMESTAMPSTORETURN_BOTH);

    if (!keepSource) {
        value_.hasSourceTimestamp = false;
        value_.sourceTimestamp = 0;
        value_.hasSourcePicoseconds = false;
        value_.sourcePicoseconds = 0;
    }

    if (!keepServer) {
        value_.hasServerTimestamp = false;
        value_.serverTimestamp = 0;
        value_.hasServerPicoseconds = false;
        value_.serverPicoseconds = 0;
    } else if (!value_.hasServerTimestamp) {
        setServerTimestamp(now);
    }
}

std::string DataValue::valueToString() const {
    const UA_Variant& variant = value_.value;
    if (!value_.hasValue || UA_Variant_isEmpty(&variant)) {
        return "";
    }

    if (variant.type == &UA_TYPES[UA_TYPES_BOOLEAN]) {
        return *static_cast<const UA_Boolean*>(variant.data) ? "true" : "false";
    }
    if (variant.type == &UA_TYPES[UA_TYPES_STRING]) {
        const UA_String* str = static_cast<const UA_String*>(variant.data);
        if (str->data && str->length > 0) {
            return std::string(reinterpret_cast<const char*>(str->data), str->length);
        }
        return "";
    }
    if (variant.type == &UA_TYPES[UA_TYPES_DATETIME]) {
        return std::to_string(toUnixMilliseconds(*static_cast<const UA_DateTime*>(variant.data)));
    }

    auto numeric = numericValue();
    if (numeric) {
        std::ostringstream oss;
        oss << *numeric;
        return oss.str();
    }

    return std::string("Unsupported type: ") + variant.type->typeName;
}

nlohmann::json DataValue::toJson() const {
    nlohmann::json result = {
        {"status", statusCodeToString(status())}
    };

    auto numeric = numericValue();
    if (numeric) {
        result["value"] = *numeric;
    } else if (value_.hasValue && value_.value.type == &UA_TYPES[UA_TYPES_BOOLEAN]) {
        result["value"] = *static_cast<const UA_Boolean*>(value_.value.data) != 0;
    } else if (value_.hasValue) {
        result["value"] = valueToString();
    } else {
        result["value"] = nullptr;
    }

    if (value_.hasSourceTimestamp) {
        result["sourceTimestamp"] = toUnixMilliseconds(value_.sourceTimestamp);
    }
    if (value_.hasServerTimestamp) {
        result["serverTimestamp"] = toUnixMilliseconds(value_.serverTimestamp);
    }

    return result;
}

int64_t DataValue::toUnixMilliseconds(UA_DateTime dateTime) {
    // OPC UA DateTime counts 100ns intervals since January 1, 1601 UTC
    if (dateTime < UA_DATETIME_UNIX_EPOCH) {
        return 0;
    }
    return (dateTime - UA_DATETIME_UNIX_EPOCH) / UA_DATETIME_MSEC;
}

std::string DataValue::statusCodeToString(UA_StatusCode status) {
    const char* statusName = UA_StatusCode_name(status);
    if (statusName && std::string(statusName) != "Unknown StatusCode") {
        return std::string(statusName);
    }

    std::ostringstream oss;
    oss << "0x" << std::hex << status;
    return oss.str();
}

} // namespace opcuasub
