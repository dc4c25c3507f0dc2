#pragma once

#include "HandLandmarks.h"
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace nebula {

// ============================================================
// LandmarkStream — OSC 1.0 codec for detector landmark frames
//
//   /nebula/hands  ,i [i f f ... ]*
//   int32 hand count H, then per hand: int32 landmark count L
//   followed by 2L float32 (x0, y0, x1, y1, ...)
//
// Big-endian, strings NUL-terminated and padded to 4 bytes.
// Hands with more than MaxLandmarksPerHand landmarks are skipped and
// only the first MaxHands kept hands are returned; the frame itself
// is rejected only when it is structurally broken or oversized.
// ============================================================
namespace LandmarkStream {

    inline constexpr const char* Address = "/nebula/hands";
    inline constexpr int MaxHands = 4;
    inline constexpr int MaxLandmarksPerHand = 32;
    inline constexpr int MaxDatagramBytes = 4096;

    namespace detail {

        inline void writeString(std::vector<uint8_t>& buf, const std::string& s)
        {
            for (char c : s) buf.push_back((uint8_t)c);
            buf.push_back(0);
            while (buf.size() % 4 != 0) buf.push_back(0);
        }

        inline void writeInt32(std::vector<uint8_t>& buf, int32_t val)
        {
            auto u = (uint32_t)val;
            buf.push_back((uint8_t)((u >> 24) & 0xFF));
            buf.push_back((uint8_t)((u >> 16) & 0xFF));
            buf.push_back((uint8_t)((u >> 8) & 0xFF));
            buf.push_back((uint8_t)(u & 0xFF));
        }

        inline void writeFloat32(std::vector<uint8_t>& buf, float val)
        {
            uint32_t bits;
            std::memcpy(&bits, &val, 4);
            writeInt32(buf, (int32_t)bits);
        }

        // Reads a padded OSC string; advances offset past the padding
        inline bool readString(const uint8_t* data, int length, int& offset, std::string& out)
        {
            int start = offset;
            while (offset < length && data[offset] != 0) ++offset;
            if (offset >= length) return false;
            out.assign((const char*)data + start, (size_t)(offset - start));
            ++offset;
            while (offset % 4 != 0) ++offset;
            return offset <= length;
        }

        inline bool readUInt32(const uint8_t* data, int length, int& offset, uint32_t& out)
        {
            if (offset + 4 > length) return false;
            out = ((uint32_t)data[offset] << 24) | ((uint32_t)data[offset + 1] << 16)
                | ((uint32_t)data[offset + 2] << 8) | (uint32_t)data[offset + 3];
            offset += 4;
            return true;
        }

    } // namespace detail

    inline std::vector<uint8_t> encode(const std::vector<Hand>& hands)
    {
        std::string tags = ",i";
        for (auto& hand : hands) {
            tags += 'i';
            tags.append(hand.size() * 2, 'f');
        }

        std::vector<uint8_t> buf;
        detail::writeString(buf, Address);
        detail::writeString(buf, tags);
        detail::writeInt32(buf, (int32_t)hands.size());
        for (auto& hand : hands) {
            detail::writeInt32(buf, (int32_t)hand.size());
            for (auto& lm : hand) {
                detail::writeFloat32(buf, lm.x);
                detail::writeFloat32(buf, lm.y);
            }
        }
        return buf;
    }

    // Parse one datagram. Returns false (and leaves `out` empty) on any
    // address, type-tag or length mismatch, a negative count, or a
    // datagram larger than MaxDatagramBytes.
    inline bool parse(const uint8_t* data, int length, std::vector<Hand>& out)
    {
        out.clear();
        if (data == nullptr || length < 8 || length > MaxDatagramBytes) return false;

        int offset = 0;
        std::string address, tags;
        if (!detail::readString(data, length, offset, address) || address != Address)
            return false;
        if (!detail::readString(data, length, offset, tags) || tags.size() < 2 || tags[0] != ',')
            return false;

        size_t tag = 1;
        auto nextTag = [&](char expected) {
            return tag < tags.size() && tags[tag++] == expected;
        };

        uint32_t raw = 0;
        if (!nextTag('i') || !detail::readUInt32(data, length, offset, raw))
            return false;
        auto handCount = (int32_t)raw;
        if (handCount < 0)
            return false;

        std::vector<Hand> hands;
        hands.reserve((size_t)MaxHands);
        for (int h = 0; h < handCount; ++h) {
            if (!nextTag('i') || !detail::readUInt32(data, length, offset, raw))
                return false;
            auto lmCount = (int32_t)raw;
            if (lmCount < 0)
                return false;

            // Payload is always consumed so later hands stay aligned
            bool keep = lmCount <= MaxLandmarksPerHand && (int)hands.size() < MaxHands;
            Hand hand(keep ? (size_t)lmCount : 0);
            for (int i = 0; i < lmCount; ++i) {
                uint32_t bx = 0, by = 0;
                if (!nextTag('f') || !detail::readUInt32(data, length, offset, bx)) return false;
                if (!nextTag('f') || !detail::readUInt32(data, length, offset, by)) return false;
                if (keep) {
                    std::memcpy(&hand[(size_t)i].x, &bx, 4);
                    std::memcpy(&hand[(size_t)i].y, &by, 4);
                }
            }
            if (keep)
                hands.push_back(std::move(hand));
        }

        // Trailing type tags mean the sender disagrees with us on layout
        if (tag != tags.size())
            return false;

        out = std::move(hands);
        return true;
    }

} // namespace LandmarkStream
} // namespace nebula
