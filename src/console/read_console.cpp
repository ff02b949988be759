// Reads a built-in sample document aloud through the synthetic speech engine.
// Usage: read_console [--speed X] [--time-scale X] [--style smart|voice|tones|both]
//                     [--no-language] [--skip-code] [--resume POS] [--rewind-at N SECONDS]
//                     [--engine ID] [--log-level LEVEL] [--quiet] [--list-engines]
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "app/reader_controller.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "reader/document.hpp"

namespace {

std::atomic<bool> g_should_stop{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_should_stop = true;
    }
}

reader::Document sample_document() {
    return reader::DocumentBuilder()
        .header("Getting started with the reader", 1)
        .paragraph("This document is read aloud one utterance at a time. Sentences are grouped into "
                   "chunks of a couple of hundred characters, and a chunk never crosses into the next section. "
                   "Code is announced instead of being read symbol by symbol.")
        .header("A small example", 2)
        .paragraph("The following block prints a greeting.")
        .code_block("def greet(name):\n    print(f\"Hello, {name}!\")\n\ngreet(\"listener\")", "python")
        .paragraph("After the block, reading continues with ordinary prose. You can rewind by a few seconds "
                   "at any time, and recently heard sentences are replayed without being chunked again.")
        .list("- Skip to the next section\n- Skip to the previous section\n- Change the speaking rate")
        .blockquote("Listening is reading with your ears.")
        .build();
}

} // namespace

int main(int argc, char** argv) {
    core::Config cfg = core::get_config();
    app::ReaderConfig reader_cfg;
    reader_cfg.engine_time_scale = 0.25;

    int64_t resume_position = 0;
    int rewind_after = -1;
    double rewind_seconds = 5.0;
    bool list_engines = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--speed" && i + 1 < argc) { reader_cfg.speed = static_cast<float>(std::atof(argv[++i])); continue; }
        if (a == "--time-scale" && i + 1 < argc) { reader_cfg.engine_time_scale = std::atof(argv[++i]); continue; }
        if (a == "--resume" && i + 1 < argc) { resume_position = std::atoll(argv[++i]); continue; }
        if (a == "--engine" && i + 1 < argc) { cfg.speech_engine = argv[++i]; continue; }
        if (a == "--no-language") { reader_cfg.announce_language = false; continue; }
        if (a == "--skip-code") { reader_cfg.skip_technical_sections = true; continue; }
        if (a == "--quiet") { cfg.echo_utterances = false; continue; }
        if (a == "--list-engines") { list_engines = true; continue; }
        if (a == "--rewind-at" && i + 2 < argc) {
            rewind_after = std::atoi(argv[++i]);
            rewind_seconds = std::atof(argv[++i]);
            continue;
        }
        if (a == "--style" && i + 1 < argc) {
            std::string name = argv[++i];
            if (!reader::parse_notification_style(name, reader_cfg.notification_style)) {
                std::cerr << "Unknown --style '" << name << "' (smart, voice, tones, both)" << std::endl;
                return 2;
            }
            continue;
        }
        if (a == "--log-level" && i + 1 < argc) {
            std::string name = argv[++i];
            if (!core::parse_log_level(name, cfg.log_level)) {
                std::cerr << "Unknown --log-level '" << name << "'" << std::endl;
                return 2;
            }
            continue;
        }
        std::cerr << "Unknown argument: " << a << std::endl;
        return 2;
    }

    core::set_config(cfg);
    reader_cfg.engine_id = cfg.speech_engine;
    reader_cfg.echo_utterances = cfg.echo_utterances;

    if (list_engines) {
        for (const auto& engine : app::ReaderController::list_speech_engines()) {
            std::cout << engine.id << "\t" << engine.name << (engine.is_default ? " [DEFAULT]" : "") << std::endl;
        }
        return 0;
    }

    signal(SIGINT, signal_handler);

    app::ReaderController controller;
    std::atomic<int> completed_utterances{0};

    controller.subscribe_to_sections([](const app::SectionEvent& e) {
        if (e.entered) {
            core::log_info("-- section " + std::to_string(e.section_index) + " (" + reader::to_string(e.kind) + ")");
        }
    });
    controller.subscribe_to_feedback([](reader::FeedbackType type) {
        if (type == reader::FeedbackType::CodeBlockStart || type == reader::FeedbackType::CodeBlockEnd) {
            core::log_info(std::string("~ tone: ") + reader::to_string(type));
        }
    });
    controller.subscribe_to_telemetry([&](const app::UtteranceTelemetry&) {
        completed_utterances++;
    });
    controller.subscribe_to_errors([](const app::ReaderError& e) {
        core::log_error(e.message + (e.details.empty() ? "" : ": " + e.details));
    });

    if (!controller.start(reader_cfg)) {
        std::cerr << "Failed to start reader" << std::endl;
        return 1;
    }

    reader::ResumePoint resume;
    resume.position = resume_position;
    if (!controller.load_document(sample_document(), resume) || !controller.play()) {
        std::cerr << "Reader rejected the document" << std::endl;
        controller.shutdown();
        return 1;
    }

    bool rewound = false;
    while (!g_should_stop.load()) {
        auto status = controller.get_status();
        if (status.state == app::ReaderStatus::State::COMPLETED) {
            break;
        }
        if (!rewound && rewind_after >= 0 && completed_utterances.load() >= rewind_after) {
            core::log_info("Rewinding " + std::to_string(rewind_seconds) + "s");
            controller.rewind(rewind_seconds);
            rewound = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    auto status = controller.get_status();
    std::cout << "Read " << status.position << "/" << status.text_length << " chars in "
              << status.elapsed_s << "s of speech" << std::endl;
    controller.shutdown();
    return 0;
}
