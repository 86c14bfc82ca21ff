#pragma once

#include "interfaces.h"
#include "config.h"
#include "Session/EditState.h"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
// Results
// ─────────────────────────────────────────────────────────────────────────────

enum class EditStatus {
    Ok,
    UnknownRecord,       // no record with that id (or removed meanwhile)
    InvalidTransition,   // lifecycle does not allow the request
    SourceUnavailable,   // record has no usable source buffer
    EncoderFailed,       // encoder produced nothing; record left as it was
    Superseded,          // a newer save was requested; result discarded
};

const char* to_string(EditStatus status);

struct CommitOutcome {
    EditStatus                status = EditStatus::Ok;
    std::optional<CropResult> crop;

    bool ok() const { return status == EditStatus::Ok; }
};

// One per source image.
struct EditRecord {
    std::string                        id;
    std::shared_ptr<const SourceImage> source;
    ViewportTransform                  transform;
    std::optional<CropResult>          crop;
    EditState                          state = EditState::Uploaded;
    std::uint64_t                      requested_version = 0;
};

// Snapshot of an exportable record.
struct ExportItem {
    std::string id;
    std::string name;
    CropResult  crop;
};

// ─────────────────────────────────────────────────────────────────────────────
// EditSession
//
// Owns every EditRecord, keyed by id. The table lock only guards insertion
// and removal; each record has its own mutex, so records are edited and
// committed independently.
//
// Commits snapshot the transform under the record lock, rasterize and encode
// on a worker, then attach the result only if no newer save was requested in
// the meantime.
// ─────────────────────────────────────────────────────────────────────────────

class EditSession {
public:
    explicit EditSession(std::shared_ptr<const IImageEncoder>     encoder,
                         CropperConfig                            config     = {},
                         std::shared_ptr<const IFramingEstimator> estimator  = nullptr,
                         std::shared_ptr<const ICropRasterizer>   rasterizer = nullptr);

    EditSession(const EditSession&)            = delete;
    EditSession& operator=(const EditSession&) = delete;

    // ── Records ──────────────────────────────────────────────────────────────

    // Take ownership of a decoded source and run the framing estimate.
    // Returns the new record id, or nullopt for an unusable source or a
    // failed estimate. Nothing is stored in either case.
    std::optional<std::string> ingest(SourceImage source);

    // Drop a record, its source and its crop. In-flight commits are discarded.
    bool remove(const std::string& id);

    // ── Editing ──────────────────────────────────────────────────────────────

    std::optional<ViewportTransform> update_viewport(const std::string&    id,
                                                     const ViewportUpdate& update);

    // Replace zoom/pan with a fresh estimate; the greyscale flag is kept.
    std::optional<ViewportTransform> re_estimate(const std::string& id);

    // Back to 100% at (0,0); the greyscale flag is kept.
    std::optional<ViewportTransform> reset_viewport(const std::string& id);

    // ── Commit ───────────────────────────────────────────────────────────────

    std::future<CommitOutcome> commit_crop_async(const std::string& id);
    CommitOutcome              commit_crop(const std::string& id);

    // ── Review ───────────────────────────────────────────────────────────────

    // Saves first (synchronously) if the record has no crop for its current
    // framing. If that save fails, nothing changes. A save that loses to a
    // concurrent one is retried; Superseded only if that keeps happening.
    EditStatus accept(const std::string& id);
    EditStatus unaccept(const std::string& id);
    EditStatus reject(const std::string& id);

    // ── Queries ──────────────────────────────────────────────────────────────

    std::optional<EditState>         state(const std::string& id) const;
    std::optional<ViewportTransform> transform(const std::string& id) const;
    std::optional<CropResult>        crop(const std::string& id) const;
    std::optional<std::string>       name(const std::string& id) const;

    std::vector<std::string>         ids() const;        // ingestion order
    std::vector<ExportItem>          export_eligible() const;
    std::size_t                      size() const;

    const CropperConfig&             config() const { return config_; }

private:
    struct RecordSlot {
        std::mutex mutex;
        EditRecord record;
        bool       removed = false;
    };

    std::shared_ptr<RecordSlot> find(const std::string& id) const;
    std::string                 next_id();

    // Moves the record, logging and refusing anything the lifecycle forbids.
    static bool transition(EditRecord& record, EditState to);

    static CommitOutcome run_commit(std::shared_ptr<RecordSlot>              slot,
                                    std::shared_ptr<const SourceImage>       source,
                                    ViewportTransform                        snapshot,
                                    std::uint64_t                            version,
                                    std::shared_ptr<const ICropRasterizer>   rasterizer,
                                    std::shared_ptr<const IImageEncoder>     encoder);

    CropperConfig                            config_;
    std::shared_ptr<const IImageEncoder>     encoder_;
    std::shared_ptr<const IFramingEstimator> estimator_;
    std::shared_ptr<const ICropRasterizer>   rasterizer_;

    mutable std::shared_mutex                            table_mutex_;
    std::map<std::string, std::shared_ptr<RecordSlot>>   records_;
    std::vector<std::string>                             order_;

    std::atomic<std::uint64_t> next_seq_{ 1 };
    std::mutex                 rng_mutex_;
    std::mt19937               rng_;
};
