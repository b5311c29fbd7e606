#include "store/Codec.hpp"
#include <cstring>
#include <array>
#include <utility>

namespace photodb::store {

namespace {

// Little-endian writers over a growing byte string
void write_u8(Bytes& out, uint8_t v) {
    out.push_back(static_cast<char>(v));
}

void write_u16(Bytes& out, uint16_t v) {
    for (int i = 0; i < 2; ++i) out.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
}

void write_u32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
}

void write_i64(Bytes& out, int64_t value) {
    auto v = static_cast<uint64_t>(value);
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
}

void write_string(Bytes& out, const std::string& s) {
    write_u32(out, static_cast<uint32_t>(s.size()));
    out.append(s);
}

// Bounds-checked reader; any overrun flips ok() to false
class Reader {
public:
    explicit Reader(std::string_view data) : data_(data) {}

    bool ok() const { return ok_; }
    bool at_end() const { return pos_ == data_.size(); }

    uint8_t u8() {
        if (!need(1)) return 0;
        return static_cast<uint8_t>(data_[pos_++]);
    }

    uint16_t u16() {
        if (!need(2)) return 0;
        uint16_t v = 0;
        for (int i = 0; i < 2; ++i) v |= static_cast<uint16_t>(static_cast<uint8_t>(data_[pos_++])) << (i * 8);
        return v;
    }

    uint32_t u32() {
        if (!need(4)) return 0;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(static_cast<uint8_t>(data_[pos_++])) << (i * 8);
        return v;
    }

    int64_t i64() {
        if (!need(8)) return 0;
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(static_cast<uint8_t>(data_[pos_++])) << (i * 8);
        return static_cast<int64_t>(v);
    }

    std::string string() {
        uint32_t len = u32();
        if (!need(len)) return {};
        std::string s(data_.substr(pos_, len));
        pos_ += len;
        return s;
    }

private:
    bool need(size_t n) {
        if (!ok_ || data_.size() - pos_ < n) {
            ok_ = false;
            return false;
        }
        return true;
    }

    std::string_view data_;
    size_t pos_ = 0;
    bool ok_ = true;
};

void write_header(Bytes& out, uint8_t kind) {
    write_u32(out, Codec::VALUE_MAGIC);
    write_u16(out, Codec::FORMAT_VERSION);
    write_u8(out, kind);
}

bool read_header(Reader& in, uint8_t kind) {
    uint32_t magic = in.u32();
    uint16_t version = in.u16();
    uint8_t got_kind = in.u8();
    return in.ok() && magic == Codec::VALUE_MAGIC && version == Codec::FORMAT_VERSION && got_kind == kind;
}

// Address field ids, stable on disk
enum AddressField : uint8_t {
    HouseNumber = 1,
    Road = 2,
    City = 3,
    Town = 4,
    County = 5,
    StateCode = 6,
    State = 7,
    CountryCode = 8,
};

using AddressMember = std::optional<std::string> model::Address::*;

constexpr std::array<std::pair<AddressField, AddressMember>, 8> ADDRESS_FIELDS = {{
    {HouseNumber, &model::Address::house_number},
    {Road, &model::Address::road},
    {City, &model::Address::city},
    {Town, &model::Address::town},
    {County, &model::Address::county},
    {StateCode, &model::Address::state_code},
    {State, &model::Address::state},
    {CountryCode, &model::Address::country_code},
}};

}  // namespace

Bytes Codec::fingerprint_key(const util::Fingerprint& fp) {
    Bytes key;
    key.reserve(2 + fp.digest.size());
    key.push_back(KEY_FINGERPRINT);
    key.push_back(static_cast<char>(fp.algorithm));
    key.append(reinterpret_cast<const char*>(fp.digest.data()), fp.digest.size());
    return key;
}

Bytes Codec::watermark_key(const std::string& directory) {
    Bytes key(1, KEY_WATERMARK);
    key.append(directory);
    return key;
}

Bytes Codec::geocode_key(const std::string& bucket) {
    Bytes key(1, KEY_GEOCODE);
    key.append(bucket);
    return key;
}

Bytes Codec::encode_record(const model::FingerprintRecord& record) {
    Bytes out;
    write_header(out, static_cast<uint8_t>(Kind::Record));
    write_string(out, record.canonical_path);
    write_string(out, record.date);
    write_string(out, record.location);
    return out;
}

std::optional<model::FingerprintRecord> Codec::decode_record(std::string_view bytes) {
    Reader in(bytes);
    if (!read_header(in, static_cast<uint8_t>(Kind::Record))) return std::nullopt;

    model::FingerprintRecord record;
    record.canonical_path = in.string();
    record.date = in.string();
    record.location = in.string();

    if (!in.ok() || !in.at_end() || record.canonical_path.empty()) return std::nullopt;
    return record;
}

Bytes Codec::encode_watermark(int64_t mtime_ns) {
    Bytes out;
    write_header(out, static_cast<uint8_t>(Kind::Watermark));
    write_i64(out, mtime_ns);
    return out;
}

std::optional<int64_t> Codec::decode_watermark(std::string_view bytes) {
    Reader in(bytes);
    if (!read_header(in, static_cast<uint8_t>(Kind::Watermark))) return std::nullopt;
    int64_t value = in.i64();
    if (!in.ok() || !in.at_end()) return std::nullopt;
    return value;
}

Bytes Codec::encode_address(const model::Address& address) {
    Bytes out;
    write_header(out, static_cast<uint8_t>(Kind::Address));

    uint8_t count = 0;
    for (const auto& [id, member] : ADDRESS_FIELDS) {
        if (address.*member) ++count;
    }
    write_u8(out, count);

    for (const auto& [id, member] : ADDRESS_FIELDS) {
        if (const auto& value = address.*member) {
            write_u8(out, id);
            write_string(out, *value);
        }
    }
    return out;
}

std::optional<model::Address> Codec::decode_address(std::string_view bytes) {
    Reader in(bytes);
    if (!read_header(in, static_cast<uint8_t>(Kind::Address))) return std::nullopt;

    model::Address address;
    uint8_t count = in.u8();
    for (uint8_t i = 0; i < count && in.ok(); ++i) {
        uint8_t id = in.u8();
        std::string value = in.string();
        bool known = false;
        for (const auto& [field_id, member] : ADDRESS_FIELDS) {
            if (field_id == id) {
                address.*member = std::move(value);
                known = true;
                break;
            }
        }
        if (!known) return std::nullopt;
    }

    if (!in.ok() || !in.at_end()) return std::nullopt;
    return address;
}

}  // namespace photodb::store
