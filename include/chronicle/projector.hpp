#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "chronicle/types.pb.h"
#include "macros.hpp"

namespace chronicle {

/**
 * Base class for read-model projectors.
 *
 * A projector folds the global event log into records keyed by stream id.
 * The read model is a disposable cache: rebuild() recomputes it from scratch,
 * catch_up() folds only events past the last global position seen.
 *
 * Usage:
 *   class BalanceProjector : public Projector<int64_t> {
 *   public:
 *       CHRONICLE_PROJECTOR("projector-balance")
 *   protected:
 *       void project(const EventPage& page, std::map<std::string, int64_t>& records) override;
 *   };
 */
template<typename Record>
class Projector {
public:
    virtual ~Projector() = default;

    /**
     * Get the projector name.
     */
    virtual std::string name() const = 0;

    /**
     * Discard the read model and fold the given events in order.
     */
    void rebuild(const std::vector<EventPage>& events) {
        records_.clear();
        checkpoint_ = 0;
        for (const auto& page : events) {
            fold(page);
        }
    }

    /**
     * Fold store-stamped events newer than the checkpoint. Already seen
     * positions are skipped, so overlapping batches are harmless. Events
     * without a global position (never appended) are ignored.
     */
    void catch_up(const std::vector<EventPage>& events) {
        for (const auto& page : events) {
            if (page.global_position() == 0 || page.global_position() <= checkpoint_) continue;
            fold(page);
        }
    }

    std::optional<Record> get(const std::string& key) const {
        auto it = records_.find(key);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Record> all() const {
        std::vector<Record> result;
        result.reserve(records_.size());
        for (const auto& [key, record] : records_) {
            result.push_back(record);
        }
        return result;
    }

    size_t size() const { return records_.size(); }

    /// Highest global position folded so far.
    uint64_t checkpoint() const { return checkpoint_; }

protected:
    /**
     * Fold one event into the records.
     */
    virtual void project(const EventPage& page, std::map<std::string, Record>& records) = 0;

    const std::map<std::string, Record>& records() const { return records_; }

private:
    void fold(const EventPage& page) {
        project(page, records_);
        checkpoint_ = std::max(checkpoint_, page.global_position());
    }

    std::map<std::string, Record> records_;
    uint64_t checkpoint_ = 0;
};

} // namespace chronicle
