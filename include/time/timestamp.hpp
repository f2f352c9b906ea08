#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tempo {

/**
 * @brief Canonical instant used throughout the engine
 *
 * A zone-less count of whole seconds since the Unix epoch, in UTC. Every
 * timestamp enters the graph through TimestampNormalizer and is stored,
 * compared, bucketed and serialized only in this form.
 */
class Timestamp {
public:
    static constexpr int64_t kSecondsPerDay = 86400;

    Timestamp() = default;

    static Timestamp from_unix_seconds(int64_t seconds);

    /**
     * @brief Build from UTC calendar fields
     * @throws std::invalid_argument if a field is out of range
     */
    static Timestamp from_civil(int year, int month, int day,
                                int hour = 0, int minute = 0, int second = 0);

    /**
     * @brief Parse ISO-8601 text and normalize it (naive text is read as UTC)
     */
    static Timestamp parse(const std::string& text);

    /**
     * @brief Parse serialized text, which must carry 'Z' or an explicit offset
     *
     * Used when reading values back from JSON. Zone-naive text is rejected
     * so no offset assumption is made outside a configured normalizer.
     *
     * @throws TimestampParseError on malformed or zone-naive text
     */
    static Timestamp parse_zoned(const std::string& text);

    static Timestamp now();

    int64_t unix_seconds() const { return seconds_; }

    Timestamp plus_seconds(int64_t seconds) const { return Timestamp(seconds_ + seconds); }
    Timestamp plus_days(int64_t days) const { return Timestamp(seconds_ + days * kSecondsPerDay); }

    // Signed distance in (fractional) days from this instant to `other`
    double days_until(const Timestamp& other) const {
        return static_cast<double>(other.seconds_ - seconds_) / kSecondsPerDay;
    }

    // Whole days since 1970-01-01, floored for pre-epoch instants
    int64_t days_since_epoch() const;

    /**
     * @brief Coarse layer bucket: calendar weeks since the epoch
     * @param layer_days Bucket width in days (7 gives weekly layers)
     */
    int64_t week_bucket(int layer_days = 7) const;

    /**
     * @brief Fixed serialization profile: YYYY-MM-DDTHH:MM:SSZ
     */
    std::string to_iso8601() const;

    // Calendar date only (YYYY-MM-DD)
    std::string to_date_string() const;

    bool operator==(const Timestamp& o) const { return seconds_ == o.seconds_; }
    bool operator!=(const Timestamp& o) const { return seconds_ != o.seconds_; }
    bool operator<(const Timestamp& o) const { return seconds_ < o.seconds_; }
    bool operator<=(const Timestamp& o) const { return seconds_ <= o.seconds_; }
    bool operator>(const Timestamp& o) const { return seconds_ > o.seconds_; }
    bool operator>=(const Timestamp& o) const { return seconds_ >= o.seconds_; }

private:
    explicit Timestamp(int64_t seconds) : seconds_(seconds) {}

    int64_t seconds_ = 0;
};

/**
 * @brief Timestamp as written by a caller, before normalization
 *
 * Keeps the calendar fields exactly as parsed plus the explicit UTC offset
 * when the text carried one. Raw values are only an input format; the
 * graph never stores them.
 */
struct RawTimestamp {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::optional<int> utc_offset_minutes;   // empty for zone-naive text

    bool is_zone_aware() const { return utc_offset_minutes.has_value(); }

    std::string to_string() const;
};

/**
 * @brief Parse ISO-8601 text into its raw fields
 *
 * Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM[:SS[.fraction]] ('T' or a space as
 * separator), optionally followed by 'Z', +HH:MM, -HH:MM, +HHMM or -HHMM.
 * Fractional seconds are dropped.
 *
 * @throws TimestampParseError on malformed text or out-of-range fields
 */
RawTimestamp parse_timestamp(const std::string& text);

/**
 * @brief Three-way comparison of two raw values
 * @return negative, zero or positive
 * @throws IncomparableTimestampError when exactly one side is zone-aware
 */
int compare_raw(const RawTimestamp& a, const RawTimestamp& b);

/**
 * @brief The single normalization boundary for timestamps
 */
class TimestampNormalizer {
public:
    /**
     * @param naive_offset_minutes Offset assumed for zone-naive input (0 = UTC)
     */
    explicit TimestampNormalizer(int naive_offset_minutes = 0);

    Timestamp normalize(const RawTimestamp& raw) const;
    Timestamp normalize(const std::string& text) const;
    Timestamp normalize(std::chrono::system_clock::time_point tp) const;

    int naive_offset_minutes() const { return naive_offset_minutes_; }

private:
    int naive_offset_minutes_;
};

} // namespace tempo
