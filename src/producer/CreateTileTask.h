#pragma once

#include <functional>
#include <string>
#include <utility>

namespace PlanetLod {

/**
 * One-shot wrapper around a tile fill call.
 *
 * Tasks are executed inline by the sampler that first needs the tile.
 * The done flag only flips false -> true; once set, run() is a no-op.
 * If the fill call throws, the task stays not done.
 */
class CreateTileTask {
public:
    CreateTileTask() = default;
    CreateTileTask(std::string description, std::function<void()> fill)
        : description_(std::move(description)), fill_(std::move(fill)) {}

    void run() {
        if (done_) return;
        if (fill_) {
            fill_();
        }
        done_ = true;
    }

    bool isDone() const { return done_; }
    const std::string& description() const { return description_; }

private:
    std::string description_;
    std::function<void()> fill_;
    bool done_ = false;
};

} // namespace PlanetLod
