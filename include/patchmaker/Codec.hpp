/**
 * @file Codec.hpp
 * @brief Byte codec between domain objects and canonical JSON bytes
 *
 * Any type with nlohmann to_json/from_json hooks (including the
 * NLOHMANN_DEFINE_TYPE_* macros) can be marshaled. Value itself
 * round-trips unchanged.
 *
 * Example:
 * ```cpp
 * struct Service { std::string name; int port = 0; };
 * NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Service, name, port)
 *
 * std::string bytes = marshal(Service{"web", 80});
 * // bytes == R"({"name":"web","port":80})"
 * Service back = unmarshal<Service>(bytes);
 * ```
 */

#ifndef PATCHMAKER_CODEC_HPP
#define PATCHMAKER_CODEC_HPP

#include "patchmaker/Errors.hpp"
#include "patchmaker/Value.hpp"

#include <exception>
#include <string>

namespace patchmaker {

/**
 * @brief Serialize a domain object to compact JSON bytes
 *
 * @param object Object to serialize
 * @return Compact JSON text, keys in sorted order
 * @throws EncodingError if conversion or dumping fails (e.g., invalid UTF-8)
 */
template <typename T>
std::string marshal(const T& object) {
    try {
        Value doc(object);
        return doc.dump();
    } catch (const std::exception& e) {
        throw EncodingError("marshal value", e.what());
    }
}

/**
 * @brief Deserialize JSON bytes into a new T
 *
 * @param bytes JSON text
 * @return Freshly constructed object
 * @throws DecodingError if bytes are malformed or do not fit T
 */
template <typename T>
T unmarshal(const std::string& bytes) {
    try {
        return Value::parse(bytes).get<T>();
    } catch (const std::exception& e) {
        throw DecodingError("unmarshal value", e.what());
    }
}

} // namespace patchmaker

#endif // PATCHMAKER_CODEC_HPP
