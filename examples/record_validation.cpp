/**
 * Record validation example using goof
 *
 * This example demonstrates:
 * - Fail-fast checks on a single field
 * - Collecting every violation of a record with an Accumulator
 * - Recovering from a known failure with a fallback value
 * - Parking a failure and resuming with corrected input
 */

#include <goof/goof.hpp>
#include <goof/core/platform_utils.hpp>

#include <cstdint>
#include <iostream>
#include <string_view>
#include <variant>

namespace {

enum class Channel : std::uint8_t { email = 0, sms = 1, push = 2, fax = 3 };

constexpr std::string_view goof_variant_label(Channel c) {
    switch (c) {
        case Channel::email: return "email";
        case Channel::sms: return "sms";
        case Channel::push: return "push";
        case Channel::fax: return "fax";
    }
    return "";
}

struct Subscriber {
    std::int32_t schema_version;
    std::int32_t age;
    Channel channel;
};

using FieldFailure = std::variant<goof::Mismatch<std::int32_t>,
                                  goof::OutOfRange<std::int32_t>,
                                  goof::UnknownVariant>;

constexpr std::size_t kMaxReported = 4;

const char* kind_name(const FieldFailure& f) {
    switch (goof::error_code_of(f)) {
        case goof::core::error_code::mismatch: return "mismatch";
        case goof::core::error_code::out_of_range: return "out_of_range";
        case goof::core::error_code::unknown_variant: return "unknown_variant";
        default: return "other";
    }
}

} // namespace

int main() {
    using namespace goof;
    const bool verbose = core::env_flag("GOOF_EXAMPLE_VERBOSE");

    const Subscriber record{.schema_version = 1, .age = 212, .channel = Channel::fax};

    // Fail-fast: stop at the first problem.
    if (auto r = assert_eq<std::int32_t>(2, record.schema_version); !r) {
        std::cout << "fail-fast: schema mismatch, expected " << r.error().expected
                  << " got " << r.error().actual << "\n";
    }

    // Fail-complete: every field, one report.
    Accumulator<FieldFailure, kMaxReported> acc;
    auto pushed = acc.push_all(
        assert_eq<std::int32_t>(2, record.schema_version),
        assert_in<std::int32_t>(record.age, 0, 150),
        assert_known_enum(record.channel, {Channel::email, Channel::sms, Channel::push}));
    if (!pushed) {
        std::cerr << "accumulator rejected a push: " << pushed.error().message << "\n";
        return 1;
    }
    if (auto report = acc.finalize(); !report) {
        std::cout << "fail-complete: " << report.error().size() << " violation(s)\n";
        for (const auto& f : report.error()) {
            std::cout << "  - " << kind_name(f) << "\n";
        }
    }

    // Fail-recoverable: an unsupported channel falls back to email.
    auto channel = recover(assert_known_enum(record.channel, {Channel::email, Channel::sms}),
                           any_unknown_variant, Channel::email);
    if (channel && verbose) {
        std::cerr << "[example] channel recovered to " << goof_variant_label(*channel) << std::endl;
    }

    // Resumable: park the age check and retry with a corrected value.
    auto age = try_or_resume(assert_in_with<std::int32_t>(0, 150), record.age);
    if (!age) {
        const auto& parked = age.error();
        std::cout << "resumable: age " << parked.failure.value << " outside ["
                  << parked.failure.lower << ", " << parked.failure.upper << "]\n";
        auto retried = resume(parked, 21);
        std::cout << "resumable: retry " << (retried ? "succeeded" : "failed") << "\n";
    }

    return 0;
}
