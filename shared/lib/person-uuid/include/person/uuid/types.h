/**
 * @file types.h
 * @brief Common types for the person UUID library
 *
 * Identity type enumeration and numeric limits shared by all modules.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace person::uuid {

/// @brief Swedish identity number category, value is the encoded type code
enum class IdType : uint8_t {
    ORGNR  = 0,  ///< Organisation number (legal entity)
    PERSNR = 1,  ///< Personal number (natural person, real birth date)
    SAMNR  = 2,  ///< Coordination number (birth day offset by 60)
    GDNR   = 3   ///< Reserved placeholder number (302 prefix)
};

/// Largest representable identity number (12 decimal digits)
constexpr uint64_t MAX_NUMBER = 999999999999ULL;

/// Largest representable serial (3 decimal digits)
constexpr unsigned MAX_SERIAL = 999;

constexpr int NUMBER_DIGITS = 12;
constexpr int SERIAL_DIGITS = 3;

/// @brief Convert IdType to string
inline std::string idTypeToString(IdType type) {
    switch (type) {
        case IdType::ORGNR:  return "ORGNR";
        case IdType::PERSNR: return "PERSNR";
        case IdType::SAMNR:  return "SAMNR";
        case IdType::GDNR:   return "GDNR";
    }
    return "UNKNOWN";
}

/// @brief Numeric type code (0..3)
inline unsigned idTypeCode(IdType type) {
    return static_cast<unsigned>(type);
}

/// @brief IdType for a type code, std::nullopt for codes above 3
inline std::optional<IdType> idTypeFromCode(unsigned code) {
    switch (code) {
        case 0: return IdType::ORGNR;
        case 1: return IdType::PERSNR;
        case 2: return IdType::SAMNR;
        case 3: return IdType::GDNR;
        default: return std::nullopt;
    }
}

} // namespace person::uuid
