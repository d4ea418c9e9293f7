#include "video_stego.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

#include <iostream>

namespace vdstego {

    // Lossless codecs tried in order; all keep LSBs intact.
    static const int LOSSLESS_FOURCC[] = {
        cv::VideoWriter::fourcc('F', 'F', 'V', '1'),
        cv::VideoWriter::fourcc('p', 'n', 'g', ' '),
    };

    std::string framePath(const std::string& framesDir, int index)
    {
        return framesDir + "/" + std::to_string(index) + ".png";
    }

    bool countFrames(const std::string& videoPath, int& outCount)
    {
        outCount = 0;
        cv::VideoCapture cap(videoPath);
        if (!cap.isOpened()) {
            std::cerr << "[video] Failed to open video: " << videoPath << std::endl;
            return false;
        }

        outCount = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
        return true;
    }

    bool videoFps(const std::string& videoPath, double& outFps)
    {
        outFps = 0.0;
        cv::VideoCapture cap(videoPath);
        if (!cap.isOpened()) {
            std::cerr << "[video] Failed to open video: " << videoPath << std::endl;
            return false;
        }

        outFps = cap.get(cv::CAP_PROP_FPS);
        if (outFps <= 0.0) {
            outFps = 25.0;
        }
        return true;
    }

    bool extractFrames(const std::string& videoPath,
                       const std::string& framesDir,
                       int& outCount)
    {
        outCount = 0;
        cv::VideoCapture cap(videoPath);
        if (!cap.isOpened()) {
            std::cerr << "[video] Failed to open video: " << videoPath << std::endl;
            return false;
        }

        std::cout << "[video] Extracting frames from " << videoPath << std::endl;

        cv::Mat frame;
        int count = 0;
        while (cap.read(frame)) {
            if (!cv::imwrite(framePath(framesDir, count), frame)) {
                std::cerr << "[video] Failed to write frame " << count
                          << " to " << framesDir << std::endl;
                return false;
            }
            ++count;
        }

        if (count == 0) {
            std::cerr << "[video] No frames decoded from " << videoPath << std::endl;
            return false;
        }

        outCount = count;
        std::cout << "[video] " << count << " frames extracted" << std::endl;
        return true;
    }

    bool assembleVideo(const std::string& framesDir,
                       int frameCount,
                       double fps,
                       const std::string& outputPath)
    {
        if (frameCount <= 0) {
            std::cerr << "[video] nothing to assemble\n";
            return false;
        }

        cv::Mat first = cv::imread(framePath(framesDir, 0), cv::IMREAD_COLOR);
        if (first.empty()) {
            std::cerr << "[video] Failed to load first frame from " << framesDir << std::endl;
            return false;
        }

        cv::VideoWriter writer;
        for (int fourcc : LOSSLESS_FOURCC) {
            if (writer.open(outputPath, fourcc, fps, first.size(), true)) {
                break;
            }
        }
        if (!writer.isOpened()) {
            std::cerr << "[video] No lossless codec available for " << outputPath << std::endl;
            return false;
        }

        for (int i = 0; i < frameCount; ++i) {
            cv::Mat frame = (i == 0) ? first : cv::imread(framePath(framesDir, i), cv::IMREAD_COLOR);
            if (frame.empty() || frame.size() != first.size()) {
                std::cerr << "[video] Bad frame " << i << " in " << framesDir << std::endl;
                return false;
            }
            writer.write(frame);
        }

        writer.release();
        std::cout << "[video] Done. Saved: " << outputPath << std::endl;
        return true;
    }

}
