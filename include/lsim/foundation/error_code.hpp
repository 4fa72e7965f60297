#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the league simulator.

#include <cstdint>
#include <string_view>

namespace lsim::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Data contract (0x0100 - 0x01FF)
    DataContractViolation = 0x0100,
    TeamNotFound = 0x0101,
    InvalidStanding = 0x0102,
    EmptyStandings = 0x0103,
    MissingInput = 0x0104,

    // Model building (0x0200 - 0x02FF)
    ModelError = 0x0200,
    DegenerateLeague = 0x0201,

    // Sampling (0x0300 - 0x03FF)
    SamplingError = 0x0300,
    InvalidExpectedGoals = 0x0301,
    InvalidProbability = 0x0302,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueInvalid = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Data";
        case 0x0200: return "Model";
        case 0x0300: return "Sampling";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace lsim::foundation
