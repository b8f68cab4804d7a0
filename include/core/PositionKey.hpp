/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POSITION_KEY_HPP
#define POSITION_KEY_HPP

#include <cstdint>

namespace TickGuard {

/**
 * @brief Packed 64-bit position identifier used as a hash key by every gate.
 *
 * Block keys use 26 bits for x and z and 12 bits for y. Chunk keys use the
 * full 32 bits of each column coordinate. Neither involves floating point.
 */
using PositionKey = uint64_t;

struct ChunkPos {
    int32_t x{0};
    int32_t z{0};

    ChunkPos() = default;
    ChunkPos(int32_t chunkX, int32_t chunkZ) : x(chunkX), z(chunkZ) {}

    PositionKey pack() const {
        return (static_cast<uint64_t>(x) & 0xFFFFFFFFULL) |
               ((static_cast<uint64_t>(z) & 0xFFFFFFFFULL) << 32);
    }

    static ChunkPos unpack(PositionKey key) {
        return ChunkPos(static_cast<int32_t>(static_cast<uint32_t>(key & 0xFFFFFFFFULL)),
                        static_cast<int32_t>(static_cast<uint32_t>(key >> 32)));
    }

    bool operator==(const ChunkPos& other) const {
        return x == other.x && z == other.z;
    }
};

struct BlockPos {
    // Packable range: x,z in [-2^25, 2^25), y in [-2048, 2048)
    static constexpr int32_t HORIZONTAL_LIMIT = 1 << 25;
    static constexpr int32_t VERTICAL_LIMIT = 1 << 11;

    int32_t x{0};
    int32_t y{0};
    int32_t z{0};

    BlockPos() = default;
    BlockPos(int32_t blockX, int32_t blockY, int32_t blockZ)
        : x(blockX), y(blockY), z(blockZ) {}

    PositionKey pack() const {
        return ((static_cast<uint64_t>(x) & 0x3FFFFFFULL) << 38) |
               ((static_cast<uint64_t>(z) & 0x3FFFFFFULL) << 12) |
               (static_cast<uint64_t>(y) & 0xFFFULL);
    }

    // Arithmetic right shifts restore the sign of each field
    static BlockPos unpack(PositionKey key) {
        const auto bits = static_cast<int64_t>(key);
        return BlockPos(static_cast<int32_t>(bits >> 38),
                        static_cast<int32_t>(static_cast<int64_t>(key << 52) >> 52),
                        static_cast<int32_t>(static_cast<int64_t>(key << 26) >> 38));
    }

    // 16x16 block columns; >> floors negative coordinates
    ChunkPos chunk() const { return ChunkPos(x >> 4, z >> 4); }

    bool operator==(const BlockPos& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

inline PositionKey blockKey(int32_t x, int32_t y, int32_t z) {
    return BlockPos(x, y, z).pack();
}

inline PositionKey chunkKey(int32_t chunkX, int32_t chunkZ) {
    return ChunkPos(chunkX, chunkZ).pack();
}

inline PositionKey chunkKeyOfBlock(int32_t blockX, int32_t blockZ) {
    return ChunkPos(blockX >> 4, blockZ >> 4).pack();
}

} // namespace TickGuard

#endif // POSITION_KEY_HPP
