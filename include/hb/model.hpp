#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace hb {

using Clock = std::chrono::steady_clock;

enum class FailureKind {
    Dns,
    Connect,
    Tls,
    Write,
    Read,
    Timeout,
    MalformedResponse,
};

const char* failure_kind_str(FailureKind k);

struct Success {
    int      status{};
    uint64_t bytes{};    // response body length
};

struct Failure {
    FailureKind kind{FailureKind::Connect};
    std::string message;
};

// Phase durations in ms; lookup/connect stay empty on a reused connection.
struct PhaseTimings {
    std::optional<double> lookup_ms;
    std::optional<double> connect_ms;
    std::optional<double> write_ms;
    std::optional<double> first_byte_ms;
    std::optional<double> read_ms;
};

struct Outcome {
    double                         ms{};   // dispatch start to completion
    PhaseTimings                   phases;
    std::variant<Success, Failure> result;

    bool ok() const { return std::holds_alternative<Success>(result); }
    const Success* success() const { return std::get_if<Success>(&result); }
    const Failure* failure() const { return std::get_if<Failure>(&result); }
};

} // namespace hb
