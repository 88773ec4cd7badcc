// SPDX-License-Identifier: Apache-2.0
#include "sim/collision.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace botarena::sim {

int quantize_angle(float deg)
{
    int q = static_cast<int>(std::lround(wrap360(deg) / kMaskAngleStep)) * kMaskAngleStep;
    return q % 360;
}

CollisionMask::CollisionMask(uint32_t width, uint32_t height, std::vector<uint8_t> cells)
    : width_(width), height_(height), cells_(std::move(cells))
{
    cells_.resize(static_cast<size_t>(width_) * height_, 0);
}

CollisionMask CollisionMask::from_alpha(const AlphaBitmap &bitmap, uint8_t threshold)
{
    std::vector<uint8_t> cells(static_cast<size_t>(bitmap.width) * bitmap.height, 0);
    size_t n = std::min(cells.size(), bitmap.alpha.size());
    for (size_t i = 0; i < n; ++i)
        cells[i] = bitmap.alpha[i] > threshold ? 1 : 0;
    return CollisionMask(bitmap.width, bitmap.height, std::move(cells));
}

CollisionMask CollisionMask::rotated(float deg) const
{
    int q = quantize_angle(deg);
    if (q == 0 || empty())
        return *this;
    b2Rot rot = rotation(static_cast<float>(q));
    float fw = static_cast<float>(width_);
    float fh = static_cast<float>(height_);
    // Expanded canvas: bounding box of the rotated source rectangle. The epsilon absorbs float noise at
    // right angles (cos 90 is not exactly 0).
    auto out_w = static_cast<uint32_t>(std::ceil(std::fabs(fw * rot.c) + std::fabs(fh * rot.s) - 1e-4f));
    auto out_h = static_cast<uint32_t>(std::ceil(std::fabs(fw * rot.s) + std::fabs(fh * rot.c) - 1e-4f));
    std::vector<uint8_t> out(static_cast<size_t>(out_w) * out_h, 0);
    const float src_cx = fw * 0.5f;
    const float src_cy = fh * 0.5f;
    const float dst_cx = static_cast<float>(out_w) * 0.5f;
    const float dst_cy = static_cast<float>(out_h) * 0.5f;
    for (uint32_t y = 0; y < out_h; ++y) {
        for (uint32_t x = 0; x < out_w; ++x) {
            // Map each destination pixel centre back into the source frame.
            Vec2 d{static_cast<float>(x) + 0.5f - dst_cx, static_cast<float>(y) + 0.5f - dst_cy};
            Vec2 s = b2InvRotateVector(rot, d);
            int sx = static_cast<int>(std::floor(s.x + src_cx));
            int sy = static_cast<int>(std::floor(s.y + src_cy));
            if (solid(sx, sy))
                out[static_cast<size_t>(y) * out_w + x] = 1;
        }
    }
    return CollisionMask(out_w, out_h, std::move(out));
}

size_t CollisionMask::solid_count() const
{
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), uint8_t{1}));
}

HitTest CircleCollisionProvider::test_point(const std::string &, Vec2 center, float, Vec2 point)
{
    return b2Distance(center, point) < radius_ ? HitTest::hit : HitTest::miss;
}

BitmapCollisionProvider::BitmapCollisionProvider(size_t cache_capacity, float scale)
    : capacity_(std::max<size_t>(1, cache_capacity)), scale_(scale > 0.f ? scale : 1.f)
{
}

void BitmapCollisionProvider::register_plating(const std::string &plating, const AlphaBitmap &bitmap)
{
    auto mask = CollisionMask::from_alpha(bitmap);
    std::lock_guard lk(mtx_);
    base_[plating] = std::move(mask);
    // Drop stale rotations of a re-registered plating.
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (it->first.first == plating) {
            index_.erase(it->first);
            it = lru_.erase(it);
        } else {
            ++it;
        }
    }
    warned_missing_.erase(plating);
}

bool BitmapCollisionProvider::has_plating(const std::string &plating) const
{
    std::lock_guard lk(mtx_);
    return base_.count(plating) != 0;
}

std::shared_ptr<const CollisionMask> BitmapCollisionProvider::rotated_mask(const std::string &plating, float deg)
{
    int q = quantize_angle(deg);
    MaskKey key{plating, q};
    std::lock_guard lk(mtx_);
    auto bit = base_.find(plating);
    if (bit == base_.end()) {
        if (warned_missing_.insert(plating).second)
            log::warn("[collision] no bitmap for plating '{}', using radius fallback", plating);
        return nullptr;
    }
    if (auto it = index_.find(key); it != index_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second);
        ++stats_.hits;
        metrics::inc(metrics::runtime().mask_cache_hits);
        return it->second->second;
    }
    ++stats_.misses;
    metrics::inc(metrics::runtime().mask_cache_misses);
    auto mask = std::make_shared<const CollisionMask>(bit->second.rotated(static_cast<float>(q)));
    lru_.emplace_front(key, mask);
    index_[key] = lru_.begin();
    while (lru_.size() > capacity_) {
        index_.erase(lru_.back().first);
        lru_.pop_back();
        ++stats_.evictions;
        metrics::inc(metrics::runtime().mask_cache_evictions);
    }
    return mask;
}

HitTest BitmapCollisionProvider::test_point(const std::string &plating, Vec2 center, float orientation, Vec2 point)
{
    auto mask = rotated_mask(plating, orientation);
    if (!mask)
        return HitTest::unavailable;
    Vec2 local = scaled(b2Sub(point, center), 1.f / scale_);
    int px = static_cast<int>(std::floor(static_cast<float>(mask->width()) * 0.5f + local.x));
    int py = static_cast<int>(std::floor(static_cast<float>(mask->height()) * 0.5f + local.y));
    return mask->solid(px, py) ? HitTest::hit : HitTest::miss;
}

BitmapCollisionProvider::Stats BitmapCollisionProvider::stats() const
{
    std::lock_guard lk(mtx_);
    Stats s = stats_;
    s.cached = lru_.size();
    return s;
}

} // namespace botarena::sim
