#pragma once

#include <string>
#include <optional>
#include <cstdint>

#include <open62541/types.h>
#include <nlohmann/json.hpp>

namespace opcuasub {

/**
 * @brief Owning wrapper around an open62541 UA_DataValue
 *
 * The wrapped value is deep-copied on copy and released with
 * UA_DataValue_clear on destruction, so DataValues can be stored in
 * standard containers (monitored item queues, notification batches).
 */
class DataValue {
public:
    DataValue();
    explicit DataValue(const UA_DataValue& value);
    ~DataValue();

    DataValue(const DataValue& other);
    DataValue& operator=(const DataValue& other);
    DataValue(DataValue&& other) noexcept;
    DataValue& operator=(DataValue&& other) noexcept;

    /**
     * @brief Create a value-less DataValue carrying only a status code
     * @param status Status code to report
     * @param serverTimestamp Server timestamp (0 leaves it unset)
     */
    static DataValue fromStatus(UA_StatusCode status, UA_DateTime serverTimestamp = 0);

    /**
     * @brief Create a DataValue holding a copy of a scalar
     * @param data Pointer to the scalar
     * @param type open62541 type description of the scalar
     * @param sourceTimestamp Source timestamp (0 leaves it unset)
     */
    static DataValue fromScalar(const void* data, const UA_DataType* type,
                                UA_DateTime sourceTimestamp = 0);

    static DataValue fromDouble(UA_Double value, UA_DateTime sourceTimestamp = 0);
    static DataValue fromInt32(UA_Int32 value, UA_DateTime sourceTimestamp = 0);
    static DataValue fromString(const std::string& value, UA_DateTime sourceTimestamp = 0);

    const UA_DataValue& raw() const { return value_; }
    UA_DataValue& raw() { return value_; }

    /**
     * @brief Status code of the value (Good when no status is encoded)
     */
    UA_StatusCode status() const;
    void setStatus(UA_StatusCode status);

    bool hasValue() const { return value_.hasValue; }

    UA_DateTime sourceTimestamp() const;
    UA_DateTime serverTimestamp() const;
    void setSourceTimestamp(UA_DateTime timestamp);
    void setServerTimestamp(UA_DateTime timestamp);

    /**
     * @brief Numeric interpretation of a scalar value
     * @return The value as double, or nullopt for non-numeric or array values
     */
    std::optional<double> numericValue() const;

    /**
     * @brief Compare the variant payload of two values
     * @return true if both carry the same value (timestamps and status ignored)
     */
    bool sameValue(const DataValue& other) const;

    /**
     * @brief Strip timestamps the client did not ask for
     * @param timestampsToReturn Requested timestamps
     * @param now Server time used when a server timestamp is requested but missing
     */
    void applyTimestampsToReturn(UA_TimestampsToReturn timestampsToReturn, UA_DateTime now);

    /**
     * @brief Render the payload as a string
     */
    std::string valueToString() const;

    nlohmann::json toJson() const;

    /**
     * @brief Convert an OPC UA DateTime to Unix milliseconds
     */
    static int64_t toUnixMilliseconds(UA_DateTime dateTime);

    /**
     * @brief Readable name of a status code, falling back to hex
     */
    static std::string statusCodeToString(UA_StatusCode status);

private:
    UA_DataValue value_;
};

} // namespace opcuasub
