#include "cli_options.hpp"

#include <CLI/CLI.hpp>

#include <utility>

namespace cli {

    static void addKeyOptions(CLI::App* cmd, CommandLine& out) {
        cmd->add_option("--key", out.keyHex, "AES-256 key, 64 hex characters")
            ->envname("VIDSTEGO_KEY");
        cmd->add_option("--nonce", out.nonceHex, "GCM nonce, hex (24 characters)")
            ->envname("VIDSTEGO_NONCE");
        cmd->add_option("--work-dir", out.workDir, "Keep extracted frames in this directory");
    }

    bool parseArgs(int argc, const char* const argv[], CommandLine& out, int& outExitCode)
    {
        CommandLine parsed;

        CLI::App app{"vidstego - hide an encrypted message in video frames"};
        app.require_subcommand(1);

        // Frames
        CLI::App* frames = app.add_subcommand("frames", "Print the number of frames in a video");
        frames->add_option("video", parsed.video, "Input video")->required();

        // Encode
        CLI::App* encode = app.add_subcommand("encode", "Hide a message in the given frames");
        encode->add_option("video", parsed.video, "Input video")->required();
        encode->add_option("output", parsed.output, "Output video (.mkv or .avi)")->required();

        CLI::Option_group* source = encode->add_option_group("message", "Message source");
        CLI::Option* inlineMessage =
            source->add_option("--message", parsed.message, "Message text");
        CLI::Option* messageFile =
            source->add_option("--message-file", parsed.messageFile, "Read the message from a file");
        inlineMessage->excludes(messageFile);
        source->require_option(1);

        encode->add_option("--frames", parsed.frames, "Frames to use, e.g. 10-19,25")->required();
        CLI::Option* indexImage = encode->add_option(
            "--index-image", parsed.indexImage, "Cover image for the frame list");
        CLI::Option* indexOut = encode->add_option(
            "--index-out", parsed.indexOut, "PNG written with the hidden frame list");
        indexImage->needs(indexOut);
        indexOut->needs(indexImage);
        addKeyOptions(encode, parsed);

        // Decode
        CLI::App* decode = app.add_subcommand("decode", "Recover a message from a video");
        decode->add_option("video", parsed.video, "Input video")->required();

        CLI::Option_group* modes = decode->add_option_group("frame selection", "Where the fragments are");
        CLI::Option* fromImage = modes->add_option(
            "--index-image", parsed.indexImage, "PNG holding the hidden frame list");
        CLI::Option* fromSpec = modes->add_option(
            "--frames", parsed.frames, "Frames to read, e.g. 10-19,25");
        CLI::Option* scan = modes->add_flag("--scan", "Read every frame (slow)");
        fromImage->excludes(fromSpec)->excludes(scan);
        fromSpec->excludes(scan);
        modes->require_option(1);

        decode->add_option("--out", parsed.saveTo, "Also save the message to this file");
        addKeyOptions(decode, parsed);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            outExitCode = app.exit(e) == 0 ? 0 : EXIT_USAGE;
            return false;
        }

        if (*encode) {
            parsed.command = Command::Encode;
            parsed.inlineMessage = inlineMessage->count() > 0;
        } else if (*decode) {
            parsed.command = Command::Decode;
            if (fromImage->count() > 0) {
                parsed.mode = DecodeMode::IndexImage;
            } else if (fromSpec->count() > 0) {
                parsed.mode = DecodeMode::Frames;
            } else {
                parsed.mode = DecodeMode::Scan;
            }
        } else {
            parsed.command = Command::Frames;
        }

        out = std::move(parsed);
        outExitCode = 0;
        return true;
    }

}
