#include "image_decoder.hpp"
#include "errors.hpp"
#include "input_discovery.hpp"

#include <format>
#include <memory>

#include <libraw/libraw.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace doppel {

namespace fs = std::filesystem;

namespace {

struct ProcessedImageDeleter {
    void operator()(libraw_processed_image_t* image) const { LibRaw::dcraw_clear_mem(image); }
};

using ProcessedImage = std::unique_ptr<libraw_processed_image_t, ProcessedImageDeleter>;

void checkLibRaw(int rc, const char* step)
{
    if (rc != LIBRAW_SUCCESS) {
        throw DecodeError(std::format("{}: {}", step, libraw_strerror(rc)));
    }
}

} // namespace

cv::Mat decodeImage(const fs::path& path)
{
    if (classifyInput(path) == InputKind::RawImage) return decodeRawImage(path);
    return decodeStandardImage(path);
}

cv::Mat decodeStandardImage(const fs::path& path)
{
    cv::Mat gray;
    try {
        gray = cv::imread(path.string(), cv::IMREAD_GRAYSCALE | cv::IMREAD_IGNORE_ORIENTATION);
    }
    catch (const cv::Exception& e) {
        throw DecodeError(std::format("decode failed: {}", e.what()));
    }

    if (gray.empty()) {
        throw DecodeError("unsupported or corrupt image");
    }
    return gray;
}

cv::Mat decodeRawImage(const fs::path& path)
{
    // LibRaw objects are large; keep them off the worker stack
    auto raw = std::make_unique<LibRaw>();
    raw->imgdata.params.use_camera_wb = 1;
    raw->imgdata.params.half_size = 1;
    raw->imgdata.params.output_bps = 8;

    checkLibRaw(raw->open_file(path.string().c_str()), "open");
    checkLibRaw(raw->unpack(), "unpack");
    checkLibRaw(raw->dcraw_process(), "process");

    int rc = LIBRAW_SUCCESS;
    ProcessedImage image(raw->dcraw_make_mem_image(&rc));
    checkLibRaw(rc, "render");
    if (!image || image->type != LIBRAW_IMAGE_BITMAP || image->bits != 8
        || (image->colors != 1 && image->colors != 3)) {
        throw DecodeError("unexpected raw output format");
    }

    const int type = image->colors == 1 ? CV_8UC1 : CV_8UC3;
    const cv::Mat view(image->height, image->width, type, image->data);

    cv::Mat gray;
    if (image->colors == 1) gray = view.clone();
    else cv::cvtColor(view, gray, cv::COLOR_RGB2GRAY);

    return gray;
}

} // namespace doppel
