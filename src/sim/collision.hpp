// SPDX-License-Identifier: Apache-2.0
// collision.hpp - silhouette hit testing from plating alpha bitmaps.
// A plating's alpha channel is thresholded into a binary mask once; rotated copies are built lazily per
// 5 degree step and kept in a bounded LRU shared by every agent using the plating.
#pragma once
#include "sim/vector_math.hpp"

#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace botarena::sim {

enum class HitTest : uint8_t
{
    hit,
    miss,
    unavailable // no mask for this plating; caller falls back to a radius test
};

// 8-bit alpha channel, row-major, width*height bytes.
struct AlphaBitmap
{
    uint32_t width{0};
    uint32_t height{0};
    std::vector<uint8_t> alpha;
};

constexpr int kMaskAngleStep = 5;

// Nearest multiple of 5 degrees in [0, 360).
int quantize_angle(float deg);

class CollisionMask
{
public:
    CollisionMask() = default;
    CollisionMask(uint32_t width, uint32_t height, std::vector<uint8_t> cells);

    // alpha > threshold is solid
    static CollisionMask from_alpha(const AlphaBitmap &bitmap, uint8_t threshold = 128);

    // Rotated copy on an expanded canvas (nearest-neighbour). `deg` is quantized to 5 degrees first, so
    // deg and deg+360 yield identical grids.
    CollisionMask rotated(float deg) const;

    bool solid(int x, int y) const
    {
        if (x < 0 || y < 0 || x >= (int)width_ || y >= (int)height_)
            return false;
        return cells_[static_cast<size_t>(y) * width_ + static_cast<size_t>(x)] != 0;
    }

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    bool empty() const { return cells_.empty(); }
    size_t solid_count() const;
    const std::vector<uint8_t> &cells() const { return cells_; }

    bool operator==(const CollisionMask &o) const
    {
        return width_ == o.width_ && height_ == o.height_ && cells_ == o.cells_;
    }

private:
    uint32_t width_{0};
    uint32_t height_{0};
    std::vector<uint8_t> cells_;
};

class CollisionProvider
{
public:
    virtual ~CollisionProvider() = default;
    // Is `point` inside the silhouette of an agent with `plating` centred at `center` facing `orientation`?
    virtual HitTest test_point(const std::string &plating, Vec2 center, float orientation, Vec2 point) = 0;
};

// Pure radius test; never reports `unavailable`.
class CircleCollisionProvider final : public CollisionProvider
{
public:
    explicit CircleCollisionProvider(float radius) : radius_(radius) {}

    HitTest test_point(const std::string &plating, Vec2 center, float orientation, Vec2 point) override;

private:
    float radius_;
};

// Thread-safe: several battles may share one provider (and its cache) for a common plating catalog.
class BitmapCollisionProvider final : public CollisionProvider
{
public:
    struct Stats
    {
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        size_t cached{0};
    };

    explicit BitmapCollisionProvider(size_t cache_capacity = 256, float scale = 1.f);

    void register_plating(const std::string &plating, const AlphaBitmap &bitmap);
    bool has_plating(const std::string &plating) const;
    // nullptr when the plating has no bitmap
    std::shared_ptr<const CollisionMask> rotated_mask(const std::string &plating, float deg);

    HitTest test_point(const std::string &plating, Vec2 center, float orientation, Vec2 point) override;

    Stats stats() const;

private:
    using MaskKey = std::pair<std::string, int>; // plating, quantized angle
    using LruList = std::list<std::pair<MaskKey, std::shared_ptr<const CollisionMask>>>;

    size_t capacity_;
    float scale_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, CollisionMask> base_;
    LruList lru_; // front = most recent
    std::map<MaskKey, LruList::iterator> index_;
    std::unordered_set<std::string> warned_missing_;
    Stats stats_{};
};

} // namespace botarena::sim
