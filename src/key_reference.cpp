// ============================================================================
// KMS Header - Key Reference Codec Implementation
// ============================================================================

#include "kmsheader/key_reference.hpp"
#include "kmsheader/encoding.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

namespace kmsheader {

namespace {

constexpr std::string_view ARN_PREFIX = "arn:aws:kms:";
constexpr std::string_view KEY_RESOURCE = "key/";

// Hyphen positions of the 8-4-4-4-12 key id form
constexpr std::array<std::size_t, 4> KEY_ID_HYPHENS = {8, 13, 18, 23};
constexpr std::size_t KEY_ID_TEXT_SIZE = 36;

constexpr std::array<std::pair<std::string_view, MajorRegion>, 9> MAJOR_REGIONS = {{
    {"af", MajorRegion::Af},
    {"ap", MajorRegion::Ap},
    {"ca", MajorRegion::Ca},
    {"eu", MajorRegion::Eu},
    {"il", MajorRegion::Il},
    {"me", MajorRegion::Me},
    {"sa", MajorRegion::Sa},
    {"us", MajorRegion::Us},
    {"us-gov", MajorRegion::UsGov},
}};

constexpr std::array<std::pair<std::string_view, CardinalDirection>, 9> DIRECTIONS = {{
    {"north", CardinalDirection::North},
    {"east", CardinalDirection::East},
    {"south", CardinalDirection::South},
    {"west", CardinalDirection::West},
    {"central", CardinalDirection::Central},
    {"northeast", CardinalDirection::Northeast},
    {"southeast", CardinalDirection::Southeast},
    {"southwest", CardinalDirection::Southwest},
    {"northwest", CardinalDirection::Northwest},
}};

// Codes are the table indices
static_assert(static_cast<std::size_t>(MajorRegion::UsGov) == MAJOR_REGIONS.size() - 1);
static_assert(static_cast<std::size_t>(CardinalDirection::Northwest) == DIRECTIONS.size() - 1);

bool all_digits(std::string_view text) noexcept {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // anonymous namespace

// ============================================================================
// Enumeration Names
// ============================================================================

std::string_view to_string(MajorRegion major) noexcept {
    auto index = static_cast<std::size_t>(major);
    if (index >= MAJOR_REGIONS.size()) return "unknown";
    return MAJOR_REGIONS[index].first;
}

std::string_view to_string(CardinalDirection direction) noexcept {
    auto index = static_cast<std::size_t>(direction);
    if (index >= DIRECTIONS.size()) return "unknown";
    return DIRECTIONS[index].first;
}

// ============================================================================
// Region
// ============================================================================

Result<Region> Region::parse(std::string_view name) {
    // The major region may itself contain a hyphen ("us-gov"), so split from
    // the right: <major>-<direction>-<number>
    auto number_sep = name.rfind('-');
    if (number_sep == std::string_view::npos || number_sep == 0) {
        return std::unexpected(ErrorCode::InvalidReference);
    }
    std::string_view number_text = name.substr(number_sep + 1);
    std::string_view rest = name.substr(0, number_sep);

    auto direction_sep = rest.rfind('-');
    if (direction_sep == std::string_view::npos || direction_sep == 0) {
        return std::unexpected(ErrorCode::InvalidReference);
    }
    std::string_view direction_text = rest.substr(direction_sep + 1);
    std::string_view major_text = rest.substr(0, direction_sep);

    auto major = std::find_if(MAJOR_REGIONS.begin(), MAJOR_REGIONS.end(),
                              [&](const auto& entry) { return entry.first == major_text; });
    if (major == MAJOR_REGIONS.end()) {
        return std::unexpected(ErrorCode::InvalidReference);
    }

    auto direction = std::find_if(DIRECTIONS.begin(), DIRECTIONS.end(),
                                  [&](const auto& entry) { return entry.first == direction_text; });
    if (direction == DIRECTIONS.end()) {
        return std::unexpected(ErrorCode::InvalidReference);
    }

    if (!all_digits(number_text) || (number_text.size() > 1 && number_text.front() == '0')) {
        return std::unexpected(ErrorCode::InvalidReference);
    }

    unsigned long number = 0;
    auto [ptr, ec] = std::from_chars(number_text.data(),
                                     number_text.data() + number_text.size(), number);
    if (ec == std::errc::result_out_of_range || number > 0xFF) {
        return std::unexpected(ErrorCode::RegionNumberOutOfRange);
    }
    if (ec != std::errc{}) {
        return std::unexpected(ErrorCode::InvalidReference);
    }

    Region region;
    region.major = major->second;
    region.direction = direction->second;
    region.number = static_cast<std::uint8_t>(number);
    return region;
}

Result<Region> Region::decode(ByteSpan bytes) {
    if (bytes.size() != constants::REGION_SIZE) {
        return std::unexpected(ErrorCode::TooShort);
    }

    if (bytes[0] >= MAJOR_REGIONS.size() || bytes[1] >= DIRECTIONS.size()) {
        return std::unexpected(ErrorCode::MalformedReference);
    }

    Region region;
    region.major = static_cast<MajorRegion>(bytes[0]);
    region.direction = static_cast<CardinalDirection>(bytes[1]);
    region.number = bytes[2];
    return region;
}

std::string Region::to_string() const {
    std::string name(kmsheader::to_string(major));
    name += '-';
    name += kmsheader::to_string(direction);
    name += '-';
    name += std::to_string(number);
    return name;
}

std::array<Byte, constants::REGION_SIZE> Region::encode() const noexcept {
    return {static_cast<Byte>(major), static_cast<Byte>(direction), number};
}

// ============================================================================
// Key ID
// ============================================================================

Result<KeyId> KeyId::parse(std::string_view text) {
    if (text.size() != KEY_ID_TEXT_SIZE) {
        return std::unexpected(ErrorCode::InvalidReference);
    }

    std::string hex;
    hex.reserve(constants::KEY_ID_SIZE * 2);
    for (std::size_t i = 0; i < text.size(); ++i) {
        bool hyphen_position = std::find(KEY_ID_HYPHENS.begin(), KEY_ID_HYPHENS.end(), i) !=
                               KEY_ID_HYPHENS.end();
        if (hyphen_position) {
            if (text[i] != '-') {
                return std::unexpected(ErrorCode::InvalidReference);
            }
        } else if (is_lower_hex_digit(text[i])) {
            hex.push_back(text[i]);
        } else {
            return std::unexpected(ErrorCode::InvalidReference);
        }
    }

    auto raw = from_hex(hex);
    if (!raw) {
        return std::unexpected(ErrorCode::InvalidReference);
    }

    KeyId id;
    std::copy(raw->begin(), raw->end(), id.bytes.begin());
    return id;
}

Result<KeyId> KeyId::decode(ByteSpan bytes) {
    if (bytes.size() != constants::KEY_ID_SIZE) {
        return std::unexpected(ErrorCode::TooShort);
    }

    KeyId id;
    std::copy(bytes.begin(), bytes.end(), id.bytes.begin());
    return id;
}

std::string KeyId::to_string() const {
    std::string hex = to_hex(bytes);
    std::string text;
    text.reserve(KEY_ID_TEXT_SIZE);

    for (char c : hex) {
        if (std::find(KEY_ID_HYPHENS.begin(), KEY_ID_HYPHENS.end(), text.size()) !=
            KEY_ID_HYPHENS.end()) {
            text.push_back('-');
        }
        text.push_back(c);
    }
    return text;
}

// ============================================================================
// Account
// ============================================================================

Result<std::uint64_t> parse_account(std::string_view text) {
    if (text.size() != constants::ACCOUNT_DIGITS || !all_digits(text)) {
        return std::unexpected(ErrorCode::InvalidReference);
    }

    std::uint64_t account = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), account);
    if (ec != std::errc{}) {
        return std::unexpected(ErrorCode::InvalidReference);
    }
    return account;
}

std::string format_account(std::uint64_t account) {
    std::string digits = std::to_string(account);
    if (digits.size() < constants::ACCOUNT_DIGITS) {
        digits.insert(0, constants::ACCOUNT_DIGITS - digits.size(), '0');
    }
    return digits;
}

std::array<Byte, constants::ACCOUNT_SIZE> encode_account(std::uint64_t account) noexcept {
    std::array<Byte, constants::ACCOUNT_SIZE> bytes{};
    for (std::size_t i = 0; i < sizeof(account); ++i) {
        bytes[constants::ACCOUNT_SIZE - 1 - i] = static_cast<Byte>((account >> (8 * i)) & 0xFF);
    }
    return bytes;
}

Result<std::uint64_t> decode_account(ByteSpan bytes) {
    if (bytes.size() != constants::ACCOUNT_SIZE) {
        return std::unexpected(ErrorCode::TooShort);
    }

    std::size_t high_bytes = constants::ACCOUNT_SIZE - sizeof(std::uint64_t);
    if (std::any_of(bytes.begin(), bytes.begin() + high_bytes, [](Byte b) { return b != 0; })) {
        return std::unexpected(ErrorCode::MalformedReference);
    }

    std::uint64_t account = 0;
    for (std::size_t i = high_bytes; i < bytes.size(); ++i) {
        account = (account << 8) | bytes[i];
    }
    return account;
}

// ============================================================================
// Key Reference
// ============================================================================

Result<KeyReference> KeyReference::parse(std::string_view arn) {
    if (!arn.starts_with(ARN_PREFIX)) {
        return std::unexpected(ErrorCode::InvalidReference);
    }
    std::string_view rest = arn.substr(ARN_PREFIX.size());

    auto region_end = rest.find(':');
    if (region_end == std::string_view::npos) {
        return std::unexpected(ErrorCode::InvalidReference);
    }
    std::string_view region_text = rest.substr(0, region_end);
    rest = rest.substr(region_end + 1);

    auto account_end = rest.find(':');
    if (account_end == std::string_view::npos) {
        return std::unexpected(ErrorCode::InvalidReference);
    }
    std::string_view account_text = rest.substr(0, account_end);
    rest = rest.substr(account_end + 1);

    if (!rest.starts_with(KEY_RESOURCE)) {
        return std::unexpected(ErrorCode::InvalidReference);
    }
    std::string_view key_id_text = rest.substr(KEY_RESOURCE.size());

    auto region = Region::parse(region_text);
    if (!region) {
        return std::unexpected(region.error());
    }

    auto account = parse_account(account_text);
    if (!account) {
        return std::unexpected(account.error());
    }

    auto key_id = KeyId::parse(key_id_text);
    if (!key_id) {
        return std::unexpected(key_id.error());
    }

    KeyReference reference;
    reference.region = *region;
    reference.account = *account;
    reference.key_id = *key_id;
    return reference;
}

Result<KeyReference> KeyReference::decode(ByteSpan bytes) {
    if (bytes.size() != constants::KEY_REFERENCE_SIZE) {
        return std::unexpected(ErrorCode::TooShort);
    }

    auto key_id = KeyId::decode(bytes.subspan(0, constants::KEY_ID_SIZE));
    if (!key_id) {
        return std::unexpected(key_id.error());
    }

    auto account = decode_account(bytes.subspan(constants::KEY_ID_SIZE, constants::ACCOUNT_SIZE));
    if (!account) {
        return std::unexpected(account.error());
    }

    auto region = Region::decode(bytes.subspan(constants::KEY_ID_SIZE + constants::ACCOUNT_SIZE,
                                               constants::REGION_SIZE));
    if (!region) {
        return std::unexpected(region.error());
    }

    KeyReference reference;
    reference.region = *region;
    reference.account = *account;
    reference.key_id = *key_id;
    return reference;
}

Result<KeyReference> KeyReference::from_hex(std::string_view hex) {
    if (hex.size() != constants::KEY_REFERENCE_HEX_SIZE) {
        return std::unexpected(ErrorCode::MalformedReference);
    }

    auto bytes = kmsheader::from_hex(hex);
    if (!bytes) {
        return std::unexpected(ErrorCode::MalformedReference);
    }
    return decode(*bytes);
}

std::string KeyReference::to_string() const {
    std::string arn(ARN_PREFIX);
    arn += region.to_string();
    arn += ':';
    arn += format_account(account);
    arn += ':';
    arn += KEY_RESOURCE;
    arn += key_id.to_string();
    return arn;
}

std::array<Byte, constants::KEY_REFERENCE_SIZE> KeyReference::encode() const noexcept {
    std::array<Byte, constants::KEY_REFERENCE_SIZE> bytes{};
    auto out = std::copy(key_id.bytes.begin(), key_id.bytes.end(), bytes.begin());

    auto account_bytes = encode_account(account);
    out = std::copy(account_bytes.begin(), account_bytes.end(), out);

    auto region_bytes = region.encode();
    std::copy(region_bytes.begin(), region_bytes.end(), out);
    return bytes;
}

std::string KeyReference::to_hex() const {
    return kmsheader::to_hex(encode());
}

} // namespace kmsheader
