#include "inkocr.hpp"
#include "ink_utils.hpp"
#include "onnx_recognition_model.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <opencv2/imgcodecs.hpp>

namespace {

std::mutex g_console_mutex;

void Say(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << line << std::endl;
}

void Complain(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cerr << line << std::endl;
}

}

// One InkOCR per worker, each over its own session; the Ort::Env is shared.
class OCRProcessor {
private:
    Ort::Env env_;
    std::vector<std::unique_ptr<OnnxRecognitionModel>> models_;
    std::vector<std::unique_ptr<InkOCR>> pipelines_;
    std::atomic<int> processed_count_{0};

public:
    OCRProcessor(const std::string& model_path, const std::string& dict_path, const OcrConfig& config,
                 int jobs, bool use_cuda)
        : env_(ORT_LOGGING_LEVEL_WARNING, "inkocr") {
        std::cout << "Initializing OCR Pipeline..." << std::endl;

        int num_cores = std::thread::hardware_concurrency();
        if (num_cores == 0) num_cores = 4;
        int threads_per_session = std::max(1, num_cores / jobs);
        std::cout << "Threading config: " << num_cores << " cores detected, " << jobs << " workers, "
                  << threads_per_session << " intra-op threads per session" << std::endl;

        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(threads_per_session);
        session_options.SetInterOpNumThreads(1);
        if (use_cuda) {
            OrtCUDAProviderOptions cuda_options{};
            session_options.AppendExecutionProvider_CUDA(cuda_options);
        }

        Charset charset = InkUtils::LoadCharset(dict_path);
        for (int i = 0; i < jobs; ++i) {
            models_.push_back(std::make_unique<OnnxRecognitionModel>(env_, session_options, model_path));
            pipelines_.push_back(std::make_unique<InkOCR>(*models_.back(), charset, config));
        }
        std::cout << "OCR Pipeline ready!" << std::endl;
    }

    int workers() const { return static_cast<int>(pipelines_.size()); }

    OcrResult processFile(int worker, const std::string& image_path) {
        cv::Mat image = cv::imread(image_path, cv::IMREAD_COLOR);
        if (image.empty()) {
            throw std::runtime_error("Failed to load image at: " + image_path);
        }
        OcrResult result = pipelines_[worker]->Run(image);
        processed_count_++;
        return result;
    }

    int getProcessedCount() const { return processed_count_; }
};

std::string formatResult(const OcrResult& result) {
    std::ostringstream out;
    out << result.text << "\n";
    for (const auto& span : result.spans) {
        out << span.text << "\t" << std::fixed << std::setprecision(4) << span.confidence << "\t";
        const auto& points = span.box.points();
        for (size_t i = 0; i < points.size(); ++i) {
            if (i > 0) out << " ";
            out << std::setprecision(1) << points[i].x << "," << points[i].y;
        }
        out << "\n";
    }
    return out.str();
}

void saveResult(const std::string& result, const std::string& image_path, const std::string& output_dir) {
    std::filesystem::path out_path;

    if (output_dir.empty()) {
        out_path = std::filesystem::path(image_path).replace_extension(".txt");
    } else {
        std::filesystem::create_directories(output_dir);
        out_path = std::filesystem::path(output_dir) /
                   std::filesystem::path(image_path).filename().replace_extension(".txt");
    }

    std::ofstream ofs(out_path);
    if (ofs.is_open()) {
        ofs << result;
        Say("✓ Saved: " + out_path.string());
    } else {
        Complain("✗ Failed to save: " + out_path.string());
    }
}

bool isImageFile(const std::string& filepath) {
    std::string ext = std::filesystem::path(filepath).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tiff" || ext == ".tif");
}

void processFiles(OCRProcessor& processor, const std::vector<std::string>& files, const std::string& output_dir) {
    std::cout << "\n=== Processing " << files.size() << " files with " << processor.workers()
              << " workers ===" << std::endl;

    std::vector<std::future<void>> workers;
    for (int w = 0; w < processor.workers(); ++w) {
        workers.push_back(std::async(std::launch::async, [&processor, &files, &output_dir, w]() {
            for (size_t i = w; i < files.size(); i += processor.workers()) {
                const auto& file = files[i];

                if (!std::filesystem::exists(file)) {
                    Complain("✗ File not found: " + file);
                    continue;
                }
                if (!isImageFile(file)) {
                    Complain("✗ Not an image file: " + file);
                    continue;
                }

                Say("[" + std::to_string(i + 1) + "/" + std::to_string(files.size()) + "] Processing: " +
                    std::filesystem::path(file).filename().string());

                try {
                    auto start = std::chrono::steady_clock::now();
                    OcrResult result = processor.processFile(w, file);
                    auto end = std::chrono::steady_clock::now();

                    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
                    Say("⏱ Processed in " + std::to_string(duration.count()) + "ms, " +
                        std::to_string(result.spans.size()) + " words");

                    saveResult(formatResult(result), file, output_dir);
                } catch (const std::exception& e) {
                    Complain("✗ Error processing " + file + ": " + e.what());
                }
            }
        }));
    }
    for (auto& worker : workers) worker.get();

    std::cout << "\n ✓ Completed " << processor.getProcessedCount() << "/" << files.size() << " files!" << std::endl;
}

void showUsage(const char* program_name) {
    std::cout << "InkOCR - Color-based handwriting OCR\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [OPTIONS] <image_files...>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -o, --output DIR        Output directory for results\n";
    std::cout << "  -m, --model FILE        Recognition model (default: ../models/rec.onnx)\n";
    std::cout << "  -d, --dict FILE         Character dictionary (default: ../models/ppocrv5_dict.txt)\n";
    std::cout << "  -p, --preset NAME       default | handwriting | printed\n";
    std::cout << "  -g, --grouping NAME     none | line_word | dilation\n";
    std::cout << "      --min-conf F        Minimum glyph confidence\n";
    std::cout << "      --spacing F         Word spacing ratio (x median glyph width)\n";
    std::cout << "      --merge-low-conf    Merge low-confidence single glyphs into neighbours\n";
    std::cout << "  -j, --jobs N            Worker count, one model session each (default: 1)\n";
    std::cout << "  -c, --cuda              Enable CUDA acceleration\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " note1.png note2.jpg                # Process specific files\n";
    std::cout << "  " << program_name << " -p handwriting -o results/ *.png   # Handwriting preset, save to results/\n";
    std::cout << "  " << program_name << " -j 4 -g dilation scans/*.jpg       # Four workers, dilation grouping\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        showUsage(argv[0]);
        return 1;
    }

    std::vector<std::string> input_files;
    std::string output_dir;
    std::string model_path = "../models/rec.onnx";
    std::string dict_path = "../models/ppocrv5_dict.txt";
    std::string preset = "default";
    std::string grouping;
    std::string min_conf;
    std::string spacing;
    bool merge_low_conf = false;
    bool use_cuda = false;
    int jobs = 1;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            showUsage(argv[0]);
            return 0;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_dir = argv[++i];
        } else if ((arg == "-m" || arg == "--model") && i + 1 < argc) {
            model_path = argv[++i];
        } else if ((arg == "-d" || arg == "--dict") && i + 1 < argc) {
            dict_path = argv[++i];
        } else if ((arg == "-p" || arg == "--preset") && i + 1 < argc) {
            preset = argv[++i];
        } else if ((arg == "-g" || arg == "--grouping") && i + 1 < argc) {
            grouping = argv[++i];
        } else if (arg == "--min-conf" && i + 1 < argc) {
            min_conf = argv[++i];
        } else if (arg == "--spacing" && i + 1 < argc) {
            spacing = argv[++i];
        } else if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
            try {
                jobs = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                jobs = 0;
            }
            if (jobs < 1) {
                std::cerr << "Invalid job count: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--merge-low-conf") {
            merge_low_conf = true;
        } else if (arg == "-c" || arg == "--cuda") {
            use_cuda = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        } else {
            input_files.push_back(arg);
        }
    }

    if (input_files.empty()) {
        std::cerr << "Error: No input files specified." << std::endl;
        showUsage(argv[0]);
        return 1;
    }

    OcrConfig config;
    try {
        config = OcrConfig::FromPreset(preset);
        if (!grouping.empty()) config.grouping = ParseGroupingStrategy(grouping);
        if (!min_conf.empty()) config.min_confidence = std::stof(min_conf);
        if (!spacing.empty()) config.word_spacing_ratio = std::stof(spacing);
        config.confidence_merging = merge_low_conf;
        config.Validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        OCRProcessor processor(model_path, dict_path, config, jobs, use_cuda);
        processFiles(processor, input_files, output_dir);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
