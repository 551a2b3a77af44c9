#include "image_loader.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "base64_utils.hpp"
#include "utilities.hpp"

using namespace cv;
using namespace std;

Mat ImageLoader::toRgba(const Mat& decoded) {
    Mat eightBit = decoded;
    if (decoded.depth() == CV_16U) {
        decoded.convertTo(eightBit, CV_8U, 1.0 / 257.0);
    } else if (decoded.depth() != CV_8U) {
        throw ImageDecodeError("Unsupported pixel depth");
    }

    Mat rgba;
    switch (eightBit.channels()) {
        case 1:
            cvtColor(eightBit, rgba, COLOR_GRAY2RGBA);
            break;
        case 3:
            cvtColor(eightBit, rgba, COLOR_BGR2RGBA);
            break;
        case 4:
            cvtColor(eightBit, rgba, COLOR_BGRA2RGBA);
            break;
        default:
            throw ImageDecodeError("Unsupported channel count: " +
                                   to_string(eightBit.channels()));
    }
    return rgba;
}

// PNG and WebP are the inputs that can carry an alpha channel.
static bool mayCarryAlpha(const vector<unsigned char>& bytes) {
    static const unsigned char pngSignature[] = {0x89, 'P', 'N', 'G'};
    if (bytes.size() >= 4 && std::equal(pngSignature, pngSignature + 4, bytes.begin())) {
        return true;
    }
    static const unsigned char riff[] = {'R', 'I', 'F', 'F'};
    static const unsigned char webp[] = {'W', 'E', 'B', 'P'};
    return bytes.size() >= 12 && std::equal(riff, riff + 4, bytes.begin()) &&
           std::equal(webp, webp + 4, bytes.begin() + 8);
}

Mat ImageLoader::decode(const vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        throw ImageDecodeError("Failed to load image: no data");
    }

    // imdecode applies the EXIF orientation tag for every flag except IMREAD_UNCHANGED,
    // which is only needed to keep alpha.
    int flags = mayCarryAlpha(bytes) ? IMREAD_UNCHANGED : (IMREAD_COLOR | IMREAD_ANYDEPTH);
    Mat decoded = imdecode(bytes, flags);
    if (decoded.empty() || decoded.cols == 0 || decoded.rows == 0) {
        throw ImageDecodeError("Failed to load image: unrecognized format (" +
                               to_string(bytes.size()) + " bytes)");
    }

    LOGI("[ImageLoader] Decoded %dx%d, %d channels", decoded.cols, decoded.rows,
         decoded.channels());
    return toRgba(decoded);
}

Mat ImageLoader::loadFile(const string& path) {
    ifstream file(path, ios::binary);
    if (!file) {
        throw ImageDecodeError("Could not open image at " + path);
    }
    vector<unsigned char> bytes((istreambuf_iterator<char>(file)), istreambuf_iterator<char>());
    return decode(bytes);
}

Mat ImageLoader::decodeDataUrl(const string& dataUrl) {
    vector<unsigned char> bytes;
    try {
        bytes = Base64Utils::decode(Base64Utils::stripDataUrlPrefix(dataUrl));
    } catch (const invalid_argument& e) {
        throw ImageDecodeError(string("Failed to load image: ") + e.what());
    }
    return decode(bytes);
}

Mat ImageLoader::fromPixels(const unsigned char* bytes, int width, int height, int stride,
                            int channelFormat) {
    if (!bytes || width <= 0 || height <= 0) {
        throw ImageDecodeError("Empty pixel buffer");
    }
    const int64_t minStride = static_cast<int64_t>(width) * 4;
    if (stride < minStride) {
        throw ImageDecodeError("Row stride " + to_string(stride) + " is smaller than " +
                               to_string(minStride) + " bytes");
    }
    if (channelFormat != 0 && channelFormat != 1) {
        throw ImageDecodeError("Unknown channel format " + to_string(channelFormat));
    }

    // The caller keeps ownership of the buffer; the wrapper never outlives this call.
    Mat wrapped(height, width, CV_8UC4, const_cast<unsigned char*>(bytes),
                static_cast<size_t>(stride));

    Mat rgba;
    if (channelFormat == 0) {
        cvtColor(wrapped, rgba, COLOR_BGRA2RGBA);
    } else {
        rgba = wrapped.clone();
    }
    return rgba;
}

WorkingImage ImageLoader::downscale(const Mat& rgba, int maxDimension) {
    CV_Assert(rgba.type() == CV_8UC4);

    WorkingImage working;

    int longSide = std::max(rgba.cols, rgba.rows);
    if (maxDimension <= 0 || longSide <= maxDimension) {
        working.rgba = rgba;
        working.scale = 1.0;
        return working;
    }

    working.scale = static_cast<double>(maxDimension) / longSide;
    int newWidth = std::max(1, static_cast<int>(std::lround(rgba.cols * working.scale)));
    int newHeight = std::max(1, static_cast<int>(std::lround(rgba.rows * working.scale)));

    resize(rgba, working.rgba, Size(newWidth, newHeight), 0, 0, INTER_AREA);
    LOGI("[ImageLoader] Resized %dx%d -> %dx%d (scale %.3f)", rgba.cols, rgba.rows, newWidth,
         newHeight, working.scale);
    return working;
}
