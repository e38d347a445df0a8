/*
*   Name:  form_cli.cpp
*   Usage: ./build/form_cli <landmarks.jsonl> [--config assets/config/form.yml]
*                           [--exercise bicep_curl|lateral_raise] [--side left|right]
*                           [--out reports.jsonl] [--summary summary.json]
*   ==========================================================================================
*   Replays recorded pose-detector output through FormEvaluator + SessionAggregator
*/
#include "formcheck/pose/Config.h"
#include "formcheck/pose/LandmarkIO.h"
#include "formcheck/pose/Publish.h"
#include "formcheck/pose/Types.h"
#include "formcheck/judger/form_evaluator.hpp"
#include "formcheck/judger/session_aggregator.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace formcheck;

static void printUsage() {
    std::cout << "\n"
              << "Usage: form_cli <landmarks.jsonl> [--config form.yml] [--exercise bicep_curl|lateral_raise]\n"
              << "                [--side left|right] [--out reports.jsonl] [--summary summary.json]\n"
              << "Or:    form_cli -h \n"
              << "       form_cli --help \n\n"
              << "Each input line: {\"frame_index\": N, \"ts_ms\": T, \"landmarks\": {\"left_shoulder\": {\"x\":..,\"y\":..,\"visibility\":..}, ...}}\n"
              << "A line without \"landmarks\" is a frame where no pose was detected.\n\n";
}

static bool ensureParentDir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        std::cerr << "[form_cli] Failed to create directory: " << parent.string() << " : " << ec.message() << "\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    std::string config_path = "assets/config/form.yml";
    std::string input_path;
    std::string exercise_override, side_override, out_override, summary_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {            // --config [file]
            config_path = argv[++i];
        } else if (arg == "--exercise" && i + 1 < argc) {   // --exercise [bicep_curl|lateral_raise]
            exercise_override = argv[++i];
        } else if (arg == "--side" && i + 1 < argc) {       // --side [left|right]
            side_override = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {        // --out [reports.jsonl]
            out_override = argv[++i];
        } else if (arg == "--summary" && i + 1 < argc) {    // --summary [summary.json]
            summary_override = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "[form_cli] Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        } else if (input_path.empty()) {
            input_path = arg;
        }
    }

    FormConfig cfg;
    try {
        cfg = (std::filesystem::path(config_path).extension() == ".json")
                  ? FormConfig::fromJson(config_path)
                  : FormConfig::fromYaml(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[form_cli] Configuration error: " << e.what() << "\n";
        return 1;
    }
    if (!exercise_override.empty()) cfg.exercise = exercise_override;
    if (!side_override.empty())     cfg.side = side_override;
    if (!out_override.empty())      cfg.reports_output = out_override;
    if (!summary_override.empty())  cfg.summary_output = summary_override;
    if (!input_path.empty())        cfg.landmarks_jsonl = input_path;

    // configuration errors halt before any frame is read
    std::unique_ptr<FormEvaluator> evaluator;
    try {
        evaluator.reset(new FormEvaluator(cfg));
    } catch (const ConfigError& e) {
        std::cerr << "[form_cli] Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[form_cli] exercise=" << toString(evaluator->exercise())
              << " side=" << toString(evaluator->side())
              << " frame=" << cfg.coordinate_frame << "\n";
    std::cout << "[form_cli] input: " << cfg.landmarks_jsonl << "\n";

    std::vector<PoseFrame> frames;
    if (!readLandmarksJsonl(cfg.landmarks_jsonl, frames)) {
        std::cerr << "[form_cli] No frames read from " << cfg.landmarks_jsonl << "\n";
        return 2;
    }

    if (!ensureParentDir(cfg.reports_output) || !ensureParentDir(cfg.summary_output)) return 2;
    std::ofstream ofs(cfg.reports_output, std::ios::trunc);
    if (!ofs) {
        std::cerr << "[form_cli] Failed to open reports file: " << cfg.reports_output << "\n";
        return 2;
    }

    // Publish part: reports jsonl is the annotation collaborator's input
    ReportPublisher pub;
    pub.setCallback([&ofs](const FrameReport& r) {
        ofs << frameReportToJsonLine(r) << "\n";
    });
    evaluator->setPublisher(&pub);

    SessionAggregator aggregator(SmoothingOptions{cfg.smoothing_window, cfg.smoothing_polyorder});

    const size_t total = frames.size();
    size_t processed = 0;
    for (const PoseFrame& frame : frames) {
        FrameReport report = evaluator->process(frame);
        aggregator.record(report);
        ++processed;
        if (processed % 30 == 0) {
            std::cout << "[form_cli] Processed " << processed << "/" << total << " frames...\n";
        }
    }
    ofs.close();

    SessionSummary summary = aggregator.finalize();
    std::ofstream sfs(cfg.summary_output, std::ios::trunc);
    if (!sfs) {
        std::cerr << "[form_cli] Failed to open summary file: " << cfg.summary_output << "\n";
        return 2;
    }
    sfs << sessionSummaryToJson(summary) << "\n";

    std::cout << "\n" << std::string(50, '=') << "\n"
              << "Analysis Complete!\n"
              << "Total Frames: " << summary.total_frames << "\n"
              << "Undetected Frames: " << summary.undetected_frames << "\n"
              << "Valid Frames: " << summary.passed_frames << "\n"
              << "Form Accuracy: " << std::fixed << std::setprecision(2)
              << summary.clip_pass_rate * 100.0 << "%\n";
    for (const auto& r : summary.rules) {
        std::cout << "  " << std::left << std::setw(26) << r.rule
                  << " pass=" << r.passed << " fail=" << r.failed << " unknown=" << r.unknown
                  << " rate=" << r.pass_rate * 100.0 << "%\n";
    }
    std::cout << std::string(50, '=') << "\n\n"
              << "[form_cli] Reports saved to: " << cfg.reports_output << "\n"
              << "[form_cli] Summary saved to: " << cfg.summary_output << "\n";
    return 0;
}
