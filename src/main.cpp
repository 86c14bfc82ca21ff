#include "interfaces.h"
#include "config.h"
#include "Encoding/GstreamerPngEncoder.h"
#include "Encoding/OpenCVPngEncoder.h"
#include "Export/CropExporter.h"
#include "ImageInput/GstreamerImageLoader.h"
#include "ImageInput/OpenCVImageLoader.h"
#include "ImageInput/UploadValidator.h"
#include "Preview/OpenCVWindowPreview.h"
#include "Session/EditSession.h"

#include <gst/gst.h>

#include <atomic>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
// Graceful shutdown on Ctrl-C
// ─────────────────────────────────────────────────────────────────────────────

static std::atomic<bool> g_shutdown{ false };

static void signal_handler(int /*sig*/)
{
    g_shutdown.store(true);
}

// ─────────────────────────────────────────────────────────────────────────────
// Command line
// ─────────────────────────────────────────────────────────────────────────────

struct CliOptions {
    std::string              output_dir;
    std::vector<std::string> inputs;
    CropperConfig            config;
    bool                     preview = false;
};

static void print_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " <output_dir> <image> [<image> ...] [options]\n"
              << "Options:\n"
              << "  --prefix <p>          Export file prefix (default portrait_)\n"
              << "  --color               Keep colour (default greyscale)\n"
              << "  --encoder <name>      opencv | gstreamer (default opencv)\n"
              << "  --loader <name>       opencv | gstreamer (default opencv)\n"
              << "  --resampling <mode>   nearest | bilinear | area (default area)\n"
              << "  --compression <0-9>   PNG compression level (default 6)\n"
              << "  --max-size-mb <n>     Upload size limit (default 10)\n"
              << "  --preview             Show each crop in a window\n";
}

static bool parse_args(int argc, char* argv[], CliOptions& opts)
{
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--color" || arg == "--colour") {
            opts.config.default_greyscale = false;
        } else if (arg == "--preview") {
            opts.preview = true;
        } else if (arg == "--prefix") {
            if (!next(opts.config.export_prefix)) return false;
        } else if (arg == "--encoder") {
            if (!next(opts.config.encoder)) return false;
        } else if (arg == "--loader") {
            if (!next(opts.config.loader)) return false;
        } else if (arg == "--resampling") {
            if (!next(value)) return false;
            auto mode = parse_resampling(value);
            if (!mode) {
                std::cerr << "Unknown resampling mode: " << value << "\n";
                return false;
            }
            opts.config.resampling = *mode;
        } else if (arg == "--compression" || arg == "--max-size-mb") {
            if (!next(value)) return false;
            int n = 0;
            try {
                n = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "Not a number for " << arg << ": " << value << "\n";
                return false;
            }
            if (arg == "--compression") {
                opts.config.png_compression = n;
            } else if (n > 0) {
                opts.config.max_upload_bytes = static_cast<std::size_t>(n) * 1024u * 1024u;
            } else {
                std::cerr << "--max-size-mb must be positive.\n";
                return false;
            }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        return false;
    }
    opts.output_dir = positional.front();
    opts.inputs.assign(positional.begin() + 1, positional.end());
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Component factories
// ─────────────────────────────────────────────────────────────────────────────

static std::shared_ptr<IImageEncoder> make_encoder(const CropperConfig& cfg)
{
    std::shared_ptr<IImageEncoder> encoder;
    std::string config;
    if (cfg.encoder == "gstreamer") {
        encoder = std::make_shared<GstreamerPngEncoder>();
        config  = std::to_string(cfg.png_compression);
    } else if (cfg.encoder == "opencv") {
        encoder = std::make_shared<OpenCVPngEncoder>();
        config  = "png:" + std::to_string(cfg.png_compression);
    } else {
        std::cerr << "Unknown encoder: " << cfg.encoder << "\n";
        return nullptr;
    }
    if (!encoder->init(config)) {
        return nullptr;
    }
    return encoder;
}

static std::unique_ptr<ISourceLoader> make_loader(const CropperConfig& cfg)
{
    std::unique_ptr<ISourceLoader> loader;
    if (cfg.loader == "gstreamer") {
        loader = std::make_unique<GstreamerImageLoader>();
    } else if (cfg.loader == "opencv") {
        loader = std::make_unique<OpenCVImageLoader>();
    } else {
        std::cerr << "Unknown loader: " << cfg.loader << "\n";
        return nullptr;
    }
    if (!loader->init("")) {
        return nullptr;
    }
    return loader;
}

// ─────────────────────────────────────────────────────────────────────────────
// main
//
// Usage:
//   ./portrait_cropper <output_dir> <image> [<image> ...] [options]
//
// Every image gets the automatic framing estimate, is committed and accepted,
// and the accepted crops are written to <output_dir> as <prefix><stem>.png.
//
// Examples:
//   ./portrait_cropper out/ a.jpg b.png
//   ./portrait_cropper out/ *.jpg --color --encoder gstreamer --preview
// ─────────────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[])
{
    // ── GStreamer global init ────────────────────────────────────────────────
    gst_init(&argc, &argv);

    // ── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT,  signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Configuration ────────────────────────────────────────────────────────
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }
    const CropperConfig& cfg = opts.config;

    std::cout << "Output dir   : " << opts.output_dir << "\n"
              << "Inputs       : " << opts.inputs.size() << "\n"
              << "Output frame : " << OUTPUT_WIDTH << "x" << OUTPUT_HEIGHT
              << (cfg.default_greyscale ? " greyscale" : " colour") << "\n"
              << "Resampling   : " << to_string(cfg.resampling) << "\n";

    // ── Instantiate pipeline stages ──────────────────────────────────────────
    auto encoder = make_encoder(cfg);
    if (!encoder) {
        std::cerr << "Encoder init failed.\n";
        return 1;
    }
    auto loader = make_loader(cfg);
    if (!loader) {
        std::cerr << "Loader init failed.\n";
        return 1;
    }

    CropExporter exporter(opts.output_dir, cfg.export_prefix);
    if (!exporter.init()) {
        std::cerr << "Exporter init failed.\n";
        return 1;
    }

    std::unique_ptr<ICropPreview> preview;
    if (opts.preview) {
        preview = std::make_unique<OpenCVWindowPreview>();
        if (!preview->init("Crop preview:0")) {
            std::cerr << "Preview unavailable, continuing without it.\n";
            preview.reset();
        }
    }

    EditSession session(encoder, cfg);

    // ── Ingest ───────────────────────────────────────────────────────────────
    std::size_t rejected_uploads = 0;
    for (const auto& path : opts.inputs) {
        if (g_shutdown.load()) break;

        const UploadCheck check = validate_upload(path, cfg.max_upload_bytes);
        if (!check.ok()) {
            std::cerr << check.message << "\n";
            ++rejected_uploads;
            continue;
        }

        auto source = loader->load(path);
        if (!source || !session.ingest(std::move(*source))) {
            std::cerr << path << " couldn't be uploaded.\n";
            ++rejected_uploads;
        }
    }

    // ── Commit every record in parallel ──────────────────────────────────────
    std::vector<std::pair<std::string, std::future<CommitOutcome>>> pending;
    for (const auto& id : session.ids()) {
        if (g_shutdown.load()) break;
        pending.emplace_back(id, session.commit_crop_async(id));
    }

    std::size_t frame_count = 0;
    for (auto& [id, future] : pending) {
        const CommitOutcome outcome = future.get();
        if (!outcome.ok()) {
            std::cerr << "Commit failed for " << id << ": " << to_string(outcome.status) << "\n";
            continue;
        }

        const EditStatus accepted = session.accept(id);
        if (accepted != EditStatus::Ok) {
            std::cerr << "Accept failed for " << id << ": " << to_string(accepted) << "\n";
            continue;
        }

        if (preview && preview->is_open() && !g_shutdown.load()
            && !preview->show(*outcome.crop)) {
            std::cout << "Preview closed.\n";
        }

        ++frame_count;
        if (frame_count % 10 == 0) {
            std::cout << "Processed " << frame_count << " images\n";
        }
    }

    // ── Export ───────────────────────────────────────────────────────────────
    const std::size_t written = exporter.export_all(session);

    // ── Cleanup ──────────────────────────────────────────────────────────────
    if (preview) preview->close();

    std::cout << "Done. " << written << " exported, " << rejected_uploads
              << " rejected at upload.\n";
    return (written > 0 || opts.inputs.empty()) ? 0 : 1;
}
