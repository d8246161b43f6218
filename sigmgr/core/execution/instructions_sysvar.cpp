// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "instructions_sysvar.hpp"

#include <algorithm>
#include <limits>

#include <sigmgr/core/common/assert.hpp>
#include <sigmgr/core/common/base.hpp>
#include <sigmgr/core/common/endian.hpp>

namespace sigmgr {

namespace {

    constexpr size_t kU16Size{sizeof(uint16_t)};
    constexpr size_t kMaxU16{std::numeric_limits<uint16_t>::max()};

    void append_u16(Bytes& to, size_t value) {
        uint8_t buf[kU16Size];
        endian::store_little_u16(buf, static_cast<uint16_t>(value));
        to.append(buf, kU16Size);
    }

    // Bounds-checked sequential reader
    class Reader {
      public:
        Reader(ByteView data, size_t pos) : data_{data}, pos_{pos} {}

        tl::expected<uint16_t, DecodingError> read_u16() noexcept {
            if (pos_ + kU16Size > data_.size()) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            const uint16_t value{endian::load_little_u16(&data_[pos_])};
            pos_ += kU16Size;
            return value;
        }

        tl::expected<uint8_t, DecodingError> read_u8() noexcept {
            if (pos_ >= data_.size()) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            return data_[pos_++];
        }

        tl::expected<ByteView, DecodingError> read_bytes(size_t size) noexcept {
            if (pos_ > data_.size() || size > data_.size() - pos_) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            const ByteView bytes{data_.substr(pos_, size)};
            pos_ += size;
            return bytes;
        }

        DecodingResult read_identity(Identity& to) noexcept {
            const auto bytes{read_bytes(kIdentityLength)};
            if (!bytes) {
                return tl::unexpected{bytes.error()};
            }
            std::copy_n(bytes->data(), kIdentityLength, to.bytes);
            return {};
        }

      private:
        ByteView data_;
        size_t pos_;
    };

}  // namespace

std::optional<Bytes> serialize_instructions(std::span<const Instruction> instructions) {
    if (instructions.size() > kMaxU16) {
        return std::nullopt;
    }

    Bytes out;
    append_u16(out, instructions.size());
    const size_t offsets_start{out.size()};
    out.resize(offsets_start + kU16Size * instructions.size());

    for (size_t i{0}; i < instructions.size(); ++i) {
        const Instruction& instruction{instructions[i]};
        if (out.size() > kMaxU16 || instruction.accounts.size() > kMaxU16 || instruction.data.size() > kMaxU16) {
            return std::nullopt;
        }
        endian::store_little_u16(&out[offsets_start + kU16Size * i], static_cast<uint16_t>(out.size()));

        append_u16(out, instruction.accounts.size());
        for (const AccountMeta& meta : instruction.accounts) {
            uint8_t flags{0};
            if (meta.is_signer) {
                flags |= kAccountSignerFlag;
            }
            if (meta.is_writable) {
                flags |= kAccountWritableFlag;
            }
            out.push_back(flags);
            out.append(meta.key.bytes, kIdentityLength);
        }
        out.append(instruction.program_id.bytes, kIdentityLength);
        append_u16(out, instruction.data.size());
        out.append(instruction.data);
    }

    append_u16(out, 0);
    return out;
}

void store_current_index(Bytes& data, uint16_t index) {
    SIGMGR_ASSERT(data.size() >= kU16Size);
    endian::store_little_u16(&data[data.size() - kU16Size], index);
}

tl::expected<uint16_t, DecodingError> load_current_index(ByteView data) noexcept {
    if (data.size() < kU16Size) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return endian::load_little_u16(&data[data.size() - kU16Size]);
}

tl::expected<Instruction, DecodingError> load_instruction_at(ByteView data, size_t index) {
    Reader header{data, 0};
    const auto count{header.read_u16()};
    if (!count) {
        return tl::unexpected{count.error()};
    }
    if (index >= *count) {
        return tl::unexpected{DecodingError::kOutOfRange};
    }

    Reader offset_reader{data, kU16Size * (1 + index)};
    const auto offset{offset_reader.read_u16()};
    if (!offset) {
        return tl::unexpected{offset.error()};
    }

    Reader reader{data, *offset};
    const auto num_accounts{reader.read_u16()};
    if (!num_accounts) {
        return tl::unexpected{num_accounts.error()};
    }

    Instruction instruction;
    instruction.accounts.reserve(*num_accounts);
    for (size_t i{0}; i < *num_accounts; ++i) {
        const auto flags{reader.read_u8()};
        if (!flags) {
            return tl::unexpected{flags.error()};
        }
        AccountMeta meta{
            .is_signer = (*flags & kAccountSignerFlag) != 0,
            .is_writable = (*flags & kAccountWritableFlag) != 0,
        };
        if (const DecodingResult res{reader.read_identity(meta.key)}; !res) {
            return tl::unexpected{res.error()};
        }
        instruction.accounts.push_back(meta);
    }

    if (const DecodingResult res{reader.read_identity(instruction.program_id)}; !res) {
        return tl::unexpected{res.error()};
    }

    const auto data_size{reader.read_u16()};
    if (!data_size) {
        return tl::unexpected{data_size.error()};
    }
    const auto instruction_data{reader.read_bytes(*data_size)};
    if (!instruction_data) {
        return tl::unexpected{instruction_data.error()};
    }
    instruction.data = *instruction_data;
    return instruction;
}

}  // namespace sigmgr
