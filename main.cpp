#include "cli_options.hpp"
#include "crypto.hpp"
#include "frame_slot_store.hpp"
#include "frame_spec.hpp"
#include "image_stego.hpp"
#include "pipeline.hpp"
#include "video_stego.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

    using cli::EXIT_FAILED;

    bool resolveCipherConfig(const cli::CommandLine& args, crypto::CipherConfig& out) {
        if (args.keyHex.empty() && args.nonceHex.empty()) {
            std::cerr << "[crypto] warning: no key given, using the built-in legacy key/nonce. "
                         "Anyone with this tool can read the message.\n";
            out = crypto::legacyCipherConfig();
            return true;
        }
        return crypto::loadCipherConfig(args.keyHex, args.nonceHex, out);
    }

    // Temporary frame directory, removed on scope exit unless user supplied.
    class WorkDir {
    public:
        explicit WorkDir(const std::string& requested) : keep_(!requested.empty()) {
            if (keep_) {
                path_ = requested;
            } else {
                path_ = (fs::temp_directory_path() /
                         ("vidstego-" + std::to_string(::getpid()))).string();
            }
        }

        ~WorkDir() {
            if (!keep_ && !path_.empty()) {
                std::error_code ec;
                fs::remove_all(path_, ec);
                if (ec) {
                    std::cerr << "[work] Failed to clean " << path_ << ": " << ec.message() << std::endl;
                }
            }
        }

        bool create() {
            std::error_code ec;
            fs::create_directories(path_, ec);
            if (ec) {
                std::cerr << "[work] Failed to create " << path_ << ": " << ec.message() << std::endl;
                return false;
            }
            return true;
        }

        const std::string& path() const { return path_; }

    private:
        std::string path_;
        bool keep_;
    };

    bool readFile(const std::string& path, std::vector<uint8_t>& out) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            std::cerr << "Failed to open " << path << std::endl;
            return false;
        }
        out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return true;
    }

    bool writeFile(const std::string& path, const std::vector<uint8_t>& data) {
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            std::cerr << "Failed to open " << path << " for writing" << std::endl;
            return false;
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return static_cast<bool>(out);
    }

    int runFrames(const cli::CommandLine& args) {
        int count = 0;
        if (!vdstego::countFrames(args.video, count)) {
            return EXIT_FAILED;
        }
        std::cout << "Total frames in video: " << count << std::endl;
        return 0;
    }

    int runEncode(const cli::CommandLine& args) {
        crypto::CipherConfig config;
        if (!resolveCipherConfig(args, config)) {
            return EXIT_FAILED;
        }
        crypto::CipherService cipher(config);

        std::vector<uint8_t> message;
        if (args.inlineMessage) {
            message.assign(args.message.begin(), args.message.end());
        } else if (!readFile(args.messageFile, message)) {
            return EXIT_FAILED;
        }

        std::vector<int> slots;
        if (framespec::parseFrameSpec(args.frames, slots) != stego::StegoError::None) {
            return EXIT_FAILED;
        }

        WorkDir work(args.workDir);
        if (!work.create()) {
            return EXIT_FAILED;
        }

        int frameCount = 0;
        double fps = 0.0;
        if (!vdstego::videoFps(args.video, fps) ||
            !vdstego::extractFrames(args.video, work.path(), frameCount))
        {
            return EXIT_FAILED;
        }

        vdstego::FrameSlotStore carrier = vdstego::FrameSlotStore::fromFrameDirectory(work.path(), frameCount);

        bool storeIndex = !args.indexImage.empty();
        std::vector<std::string> sidePaths;
        if (storeIndex) {
            if (!imgstego::convertImage(args.indexImage, args.indexOut)) {
                return EXIT_FAILED;
            }
            sidePaths.push_back(args.indexOut);
        }
        vdstego::FrameSlotStore side(sidePaths);

        pipeline::Encoder encoder(cipher, carrier, storeIndex ? &side : nullptr);
        pipeline::EncodeResult result = encoder.run(message, slots, storeIndex);
        if (result.error != stego::StegoError::None) {
            return EXIT_FAILED;
        }

        if (result.assignment.size() < slots.size()) {
            std::cout << "[encode] only frames";
            for (const pipeline::SlotAssignment& a : result.assignment) {
                std::cout << " " << a.slotId;
            }
            std::cout << " were used" << std::endl;
        }
        if (storeIndex) {
            std::cout << "[encode] frame numbers hidden in " << args.indexOut << std::endl;
        } else {
            std::cout << "[encode] frame numbers are not stored anywhere, remember them: "
                      << args.frames << std::endl;
        }

        if (!vdstego::assembleVideo(work.path(), frameCount, fps, args.output)) {
            return EXIT_FAILED;
        }
        return 0;
    }

    int runDecode(const cli::CommandLine& args) {
        crypto::CipherConfig config;
        if (!resolveCipherConfig(args, config)) {
            return EXIT_FAILED;
        }
        crypto::CipherService cipher(config);

        pipeline::SlotSelection selection;
        std::vector<std::string> sidePaths;
        switch (args.mode) {
            case cli::DecodeMode::IndexImage:
                selection.mode = pipeline::SlotSelectionMode::IndexChannel;
                sidePaths.push_back(args.indexImage);
                break;
            case cli::DecodeMode::Frames:
                selection.mode = pipeline::SlotSelectionMode::ManualSpec;
                selection.spec = args.frames;
                break;
            case cli::DecodeMode::Scan:
                selection.mode = pipeline::SlotSelectionMode::FullScan;
                std::cout << "Scanning all frames... (this can be slow)" << std::endl;
                break;
        }

        WorkDir work(args.workDir);
        if (!work.create()) {
            return EXIT_FAILED;
        }

        int frameCount = 0;
        if (!vdstego::extractFrames(args.video, work.path(), frameCount)) {
            return EXIT_FAILED;
        }

        vdstego::FrameSlotStore carrier = vdstego::FrameSlotStore::fromFrameDirectory(work.path(), frameCount);
        vdstego::FrameSlotStore side(sidePaths);

        pipeline::Decoder decoder(cipher, carrier, sidePaths.empty() ? nullptr : &side);
        pipeline::DecodeResult result = decoder.run(selection);
        if (result.error != stego::StegoError::None) {
            return EXIT_FAILED;
        }

        std::cout << (result.verified ? "[md5] verified" : "[md5] missing or mismatch") << std::endl;
        std::cout << "\n--- Decoded Message ---\n\n";
        std::cout.write(reinterpret_cast<const char*>(result.body.data()),
                        static_cast<std::streamsize>(result.body.size()));
        std::cout << "\n\n-----------------------\n" << std::endl;

        if (!args.saveTo.empty()) {
            if (!writeFile(args.saveTo, result.body)) {
                return EXIT_FAILED;
            }
            std::cout << "Saved to: " << args.saveTo << std::endl;
        }
        return 0;
    }

}

int main(int argc, char** argv) {
    cli::CommandLine args;
    int exitCode = 0;
    if (!cli::parseArgs(argc, argv, args, exitCode)) {
        return exitCode;
    }

    switch (args.command) {
        case cli::Command::Frames: return runFrames(args);
        case cli::Command::Encode: return runEncode(args);
        case cli::Command::Decode: return runDecode(args);
    }
    return cli::EXIT_USAGE;
}
