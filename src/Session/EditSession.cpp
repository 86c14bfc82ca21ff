#include "Session/EditSession.h"
#include "ColorTransform/Greyscale.h"
#include "Cropping/ViewportCropper.h"
#include "Framing/HeuristicFramer.h"
#include "Viewport/ViewportTransform.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace {

// Superseded implicit saves tolerated before accept() gives up.
constexpr int ACCEPT_ATTEMPTS = 3;

std::future<CommitOutcome> ready(EditStatus status)
{
    std::promise<CommitOutcome> p;
    p.set_value(CommitOutcome{ status, std::nullopt });
    return p.get_future();
}

} // namespace

const char* to_string(EditStatus status)
{
    switch (status) {
        case EditStatus::Ok:                return "ok";
        case EditStatus::UnknownRecord:     return "unknown record";
        case EditStatus::InvalidTransition: return "invalid transition";
        case EditStatus::SourceUnavailable: return "source unavailable";
        case EditStatus::EncoderFailed:     return "encoder failed";
        case EditStatus::Superseded:        return "superseded";
    }
    return "unknown";
}

EditSession::EditSession(std::shared_ptr<const IImageEncoder>     encoder,
                         CropperConfig                            config,
                         std::shared_ptr<const IFramingEstimator> estimator,
                         std::shared_ptr<const ICropRasterizer>   rasterizer)
    : config_(std::move(config))
    , encoder_(std::move(encoder))
    , estimator_(std::move(estimator))
    , rasterizer_(std::move(rasterizer))
    , rng_(std::random_device{}())
{
    if (!encoder_) {
        throw std::invalid_argument("EditSession requires an encoder");
    }
    if (!estimator_) {
        estimator_ = std::make_shared<HeuristicFramer>(config_.default_greyscale);
    }
    if (!rasterizer_) {
        rasterizer_ = std::make_shared<ViewportCropper>(config_.resampling);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> EditSession::ingest(SourceImage source)
{
    if (source.data.empty() || source.data.type() != CV_8UC3) {
        std::cerr << "[EditSession] Rejected source '" << source.name
                  << "': expected non-empty 8-bit BGR.\n";
        return std::nullopt;
    }

    auto slot = std::make_shared<RecordSlot>();

    // The record is built and estimated before anyone else can see it, so a
    // failed estimate leaves nothing behind.
    EditRecord& rec = slot->record;
    rec.id     = next_id();
    rec.source = std::make_shared<const SourceImage>(std::move(source));
    rec.state  = EditState::Uploaded;

    transition(rec, EditState::Estimating);
    try {
        rec.transform = estimator_->estimate(rec.source->width(), rec.source->height());
    } catch (const std::exception& e) {
        std::cerr << "[EditSession] Framing estimate failed for '" << rec.source->name
                  << "': " << e.what() << "\n";
        return std::nullopt;
    }
    transition(rec, EditState::Estimated);

    {
        std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
        records_.emplace(rec.id, slot);
        order_.push_back(rec.id);
    }

    std::cout << "[EditSession] Ingested " << rec.id << " (" << rec.source->name << ", "
              << rec.source->width() << "x" << rec.source->height() << ") → zoom "
              << rec.transform.zoom_percent << "%, pan " << rec.transform.pan << "\n";
    return rec.id;
}

bool EditSession::remove(const std::string& id)
{
    std::shared_ptr<RecordSlot> slot;
    {
        std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return false;
        }
        slot = it->second;
        records_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    std::lock_guard<std::mutex> record_lock(slot->mutex);
    slot->removed = true;
    std::cout << "[EditSession] Removed " << id << "\n";
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Editing
// ─────────────────────────────────────────────────────────────────────────────

std::optional<ViewportTransform> EditSession::update_viewport(const std::string&    id,
                                                              const ViewportUpdate& update)
{
    auto slot = find(id);
    if (!slot) {
        std::cerr << "[EditSession] update_viewport: unknown record " << id << "\n";
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->removed) return std::nullopt;

    EditRecord& rec = slot->record;
    if (rec.state != EditState::Editing && !transition(rec, EditState::Editing)) {
        return std::nullopt;
    }
    rec.transform = apply_update(rec.transform, update);
    return rec.transform;
}

std::optional<ViewportTransform> EditSession::re_estimate(const std::string& id)
{
    auto slot = find(id);
    if (!slot) {
        std::cerr << "[EditSession] re_estimate: unknown record " << id << "\n";
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->removed) return std::nullopt;

    EditRecord& rec = slot->record;
    if (rec.state != EditState::Editing && !transition(rec, EditState::Editing)) {
        return std::nullopt;
    }

    ViewportTransform fresh;
    try {
        fresh = estimator_->estimate(rec.source->width(), rec.source->height());
    } catch (const std::exception& e) {
        std::cerr << "[EditSession] re_estimate: " << id << ": " << e.what() << "\n";
        return std::nullopt;
    }
    fresh.is_greyscale = rec.transform.is_greyscale;
    rec.transform = fresh;
    return rec.transform;
}

std::optional<ViewportTransform> EditSession::reset_viewport(const std::string& id)
{
    ViewportUpdate reset;
    reset.zoom_percent = ZOOM_DEFAULT_PERCENT;
    reset.pan          = cv::Point2d(0.0, 0.0);
    return update_viewport(id, reset);
}

// ─────────────────────────────────────────────────────────────────────────────
// Commit
// ─────────────────────────────────────────────────────────────────────────────

std::future<CommitOutcome> EditSession::commit_crop_async(const std::string& id)
{
    auto slot = find(id);
    if (!slot) {
        std::cerr << "[EditSession] commit: unknown record " << id << "\n";
        return ready(EditStatus::UnknownRecord);
    }

    std::shared_ptr<const SourceImage> source;
    ViewportTransform                  snapshot;
    std::uint64_t                      version = 0;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->removed) return ready(EditStatus::UnknownRecord);

        EditRecord& rec = slot->record;
        if (!rec.source || rec.source->data.empty()) {
            std::cerr << "[EditSession] commit: " << id << " has no source buffer.\n";
            return ready(EditStatus::SourceUnavailable);
        }

        source   = rec.source;
        snapshot = rec.transform;             // frozen copy
        version  = ++rec.requested_version;
    }

    return std::async(std::launch::async, &EditSession::run_commit,
                      slot, source, snapshot, version, rasterizer_, encoder_);
}

CommitOutcome EditSession::commit_crop(const std::string& id)
{
    return commit_crop_async(id).get();
}

CommitOutcome EditSession::run_commit(std::shared_ptr<RecordSlot>            slot,
                                      std::shared_ptr<const SourceImage>     source,
                                      ViewportTransform                      snapshot,
                                      std::uint64_t                          version,
                                      std::shared_ptr<const ICropRasterizer> rasterizer,
                                      std::shared_ptr<const IImageEncoder>   encoder)
{
    // ── Rasterize + colour + encode, no lock held ───────────────────────────
    cv::Mat frame = rasterizer->rasterize(*source, snapshot);
    if (snapshot.is_greyscale && !to_greyscale_inplace(frame)) {
        std::cerr << "[EditSession] Greyscale skipped for v" << version << ".\n";
    }

    std::optional<EncodedImage> encoded = encoder->encode(frame);

    // ── Attach only if still current ─────────────────────────────────────────
    std::lock_guard<std::mutex> lock(slot->mutex);
    EditRecord& rec = slot->record;

    if (slot->removed) {
        return { EditStatus::UnknownRecord, std::nullopt };
    }
    if (version != rec.requested_version) {
        std::cout << "[EditSession] " << rec.id << " v" << version
                  << " superseded by v" << rec.requested_version << ", discarded.\n";
        return { EditStatus::Superseded, std::nullopt };
    }
    if (!encoded) {
        std::cerr << "[EditSession] " << rec.id << " v" << version
                  << ": encoder " << encoder->name() << " failed.\n";
        return { EditStatus::EncoderFailed, std::nullopt };
    }

    // Re-saving an accepted record keeps it accepted.
    const EditState next = (rec.state == EditState::Accepted) ? EditState::Accepted
                                                              : EditState::Saved;
    if (next != rec.state && !transition(rec, next)) {
        return { EditStatus::InvalidTransition, std::nullopt };
    }

    CropResult crop;
    crop.data         = frame;
    crop.transform    = snapshot;
    crop.version      = version;
    crop.committed_at = std::chrono::system_clock::now();
    crop.encoded      = std::move(*encoded);
    crop.handle       = rec.id + "#v" + std::to_string(version);

    rec.crop = crop;

    std::cout << "[EditSession] Saved " << crop.handle << " ("
              << (snapshot.is_greyscale ? "greyscale" : "colour") << ", "
              << crop.encoded.bytes.size() << " bytes)\n";
    return { EditStatus::Ok, std::move(crop) };
}

// ─────────────────────────────────────────────────────────────────────────────
// Review
// ─────────────────────────────────────────────────────────────────────────────

EditStatus EditSession::accept(const std::string& id)
{
    auto slot = find(id);
    if (!slot) {
        std::cerr << "[EditSession] accept: unknown record " << id << "\n";
        return EditStatus::UnknownRecord;
    }

    // A save can lose to a newer concurrent one that then fails or is still
    // in flight, so re-check and save again a bounded number of times.
    int superseded = 0;
    while (superseded < ACCEPT_ATTEMPTS) {
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (slot->removed) return EditStatus::UnknownRecord;

            EditRecord& rec = slot->record;
            if (rec.state == EditState::Accepted) return EditStatus::Ok;

            // No crop yet, or the crop no longer matches what is on screen.
            const bool needs_save = !rec.crop
                                 || rec.state == EditState::Estimated
                                 || rec.state == EditState::Editing;
            if (!needs_save) {
                return transition(rec, EditState::Accepted) ? EditStatus::Ok
                                                            : EditStatus::InvalidTransition;
            }
        }

        const CommitOutcome saved = commit_crop(id);
        if (saved.status == EditStatus::Superseded) {
            ++superseded;
        } else if (!saved.ok()) {
            return saved.status;
        }
    }

    std::cerr << "[EditSession] accept: " << id << " kept being superseded, giving up.\n";
    return EditStatus::Superseded;
}

EditStatus EditSession::unaccept(const std::string& id)
{
    auto slot = find(id);
    if (!slot) return EditStatus::UnknownRecord;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->removed) return EditStatus::UnknownRecord;

    EditRecord& rec = slot->record;
    if (rec.state != EditState::Accepted) {
        std::cerr << "[EditSession] unaccept: " << id << " is "
                  << to_string(rec.state) << ", not accepted.\n";
        return EditStatus::InvalidTransition;
    }
    return transition(rec, EditState::Saved) ? EditStatus::Ok
                                             : EditStatus::InvalidTransition;
}

EditStatus EditSession::reject(const std::string& id)
{
    auto slot = find(id);
    if (!slot) return EditStatus::UnknownRecord;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->removed) return EditStatus::UnknownRecord;

    EditRecord& rec = slot->record;
    if (rec.state == EditState::Rejected) return EditStatus::Ok;
    return transition(rec, EditState::Rejected) ? EditStatus::Ok
                                                : EditStatus::InvalidTransition;
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::optional<EditState> EditSession::state(const std::string& id) const
{
    auto slot = find(id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->record.state;
}

std::optional<ViewportTransform> EditSession::transform(const std::string& id) const
{
    auto slot = find(id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->record.transform;
}

std::optional<CropResult> EditSession::crop(const std::string& id) const
{
    auto slot = find(id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->record.crop;
}

std::optional<std::string> EditSession::name(const std::string& id) const
{
    auto slot = find(id);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->record.source ? slot->record.source->name : std::string{};
}

std::vector<std::string> EditSession::ids() const
{
    std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
    return order_;
}

std::vector<ExportItem> EditSession::export_eligible() const
{
    std::vector<std::shared_ptr<RecordSlot>> slots;
    {
        std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
        slots.reserve(order_.size());
        for (const auto& id : order_) {
            slots.push_back(records_.at(id));
        }
    }

    std::vector<ExportItem> items;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        const EditRecord& rec = slot->record;
        if (slot->removed || !is_export_eligible(rec.state, rec.crop.has_value())) continue;
        items.push_back({ rec.id, rec.source ? rec.source->name : std::string{}, *rec.crop });
    }
    return items;
}

std::size_t EditSession::size() const
{
    std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
    return records_.size();
}

// ─────────────────────────────────────────────────────────────────────────────
// Private helpers
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<EditSession::RecordSlot> EditSession::find(const std::string& id) const
{
    std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second;
}

std::string EditSession::next_id()
{
    static constexpr char BASE36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::string suffix(7, '0');
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_int_distribution<int> digit(0, 35);
        for (char& c : suffix) c = BASE36[digit(rng_)];
    }
    return "img-" + std::to_string(next_seq_.fetch_add(1)) + "-" + suffix;
}

bool EditSession::transition(EditRecord& record, EditState to)
{
    if (!can_transition(record.state, to)) {
        std::cerr << "[EditSession] " << record.id << ": "
                  << to_string(record.state) << " → " << to_string(to)
                  << " not allowed.\n";
        return false;
    }
    record.state = to;
    return true;
}
