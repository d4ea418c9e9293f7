#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include <string>

namespace cli {

    enum class Command { Frames, Encode, Decode };

    // How decode finds the frames holding fragments.
    enum class DecodeMode { IndexImage, Frames, Scan };

    struct CommandLine {
        Command command = Command::Frames;
        std::string video;

        // encode
        std::string output;
        std::string message;
        std::string messageFile;
        bool inlineMessage = false;   // --message given (it may be empty)
        std::string indexOut;

        // decode
        DecodeMode mode = DecodeMode::Scan;
        std::string saveTo;

        // encode and decode
        std::string frames;
        std::string indexImage;
        std::string keyHex;           // --key, else $VIDSTEGO_KEY
        std::string nonceHex;         // --nonce, else $VIDSTEGO_NONCE
        std::string workDir;
    };

    static const int EXIT_FAILED = 1;
    static const int EXIT_USAGE  = 2;

    // false if the process should exit with outExitCode (help, usage error).
    // Usage errors are printed before returning.
    bool parseArgs(int argc, const char* const argv[], CommandLine& out, int& outExitCode);
}

#endif // CLI_OPTIONS_HPP
