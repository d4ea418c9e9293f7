#ifndef VIDEO_STEGO_HPP
#define VIDEO_STEGO_HPP

#include <string>

namespace vdstego {

    // framesDir/<index>.png
    std::string framePath(const std::string& framesDir, int index);

    bool countFrames(const std::string& videoPath, int& outCount);

    bool videoFps(const std::string& videoPath, double& outFps);

    // 解码全部帧为 PNG：framesDir/0.png, 1.png, ...
    bool extractFrames(const std::string& videoPath,
                       const std::string& framesDir,
                       int& outCount);

    // 把 PNG 帧重新封装成视频，必须无损，否则 LSB 数据丢失
    bool assembleVideo(const std::string& framesDir,
                       int frameCount,
                       double fps,
                       const std::string& outputPath);
}

#endif
