#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "application/ImageResolver.hpp"
#include "infrastructure/FileUtils.hpp"
#include "infrastructure/ImageLoader.hpp"
#include "infrastructure/pdf/PdfRenderer.hpp"
#include "test/TestSupport.hpp"

using namespace docforge;
using infrastructure::FileUtils;
using infrastructure::ImageFormat;
using infrastructure::ImageLoader;

namespace fs = std::filesystem;

namespace {

void TestProbe() {
    std::cout << "[Test] Format detection and probing..." << std::endl;
    std::string png = test::MakePng(7, 3);
    assert(ImageLoader::DetectFormat(png) == ImageFormat::Png);
    auto info = ImageLoader::Probe(png);
    assert(info);
    assert(info->width == 7 && info->height == 3);
    assert(info->components == 3);

    std::string jpg = test::MakeJpegHeader(640, 480, 1);
    assert(ImageLoader::DetectFormat(jpg) == ImageFormat::Jpeg);
    info = ImageLoader::Probe(jpg);
    assert(info);
    assert(info->width == 640 && info->height == 480);
    assert(info->components == 1);

    assert(ImageLoader::DetectFormat("GIF89a......") == ImageFormat::Unknown);
    assert(!ImageLoader::Probe("GIF89a......"));
    assert(!ImageLoader::Probe(png.substr(0, 20)));
    assert(!ImageLoader::Probe(std::string("\xFF\xD8\xFF\xD9", 4)));
}

void TestDecode() {
    std::cout << "[Test] PNG decoding..." << std::endl;
    auto rgb = ImageLoader::DecodePng(test::MakePng(4, 2, 2));
    assert(rgb);
    assert(rgb->components == 3);
    assert(rgb->pixels.size() == 4 * 2 * 3);
    assert(rgb->alpha.empty());
    // Pixel (1, 0) channels are 40, 100, 160.
    assert(static_cast<unsigned char>(rgb->pixels[3]) == 40);
    assert(static_cast<unsigned char>(rgb->pixels[4]) == 100);
    assert(static_cast<unsigned char>(rgb->pixels[5]) == 160);

    auto rgba = ImageLoader::DecodePng(test::MakePng(3, 3, 6));
    assert(rgba);
    assert(rgba->pixels.size() == 3 * 3 * 3);
    assert(rgba->alpha.size() == 3 * 3);
    // Alpha of pixel (0, 1) is 20 + 3 * 60.
    assert(static_cast<unsigned char>(rgba->alpha[3]) == 200);

    auto gray = ImageLoader::DecodePng(test::MakePng(5, 1, 0));
    assert(gray);
    assert(gray->components == 1);
    assert(gray->pixels.size() == 5);

    std::string truncated = test::MakePng(4, 4);
    truncated.resize(truncated.size() - 20);
    assert(!ImageLoader::DecodePng(truncated));
    assert(!ImageLoader::DecodePng(test::MakeJpegHeader(2, 2)));
}

void TestPdfImageLoading(const test::ScratchDir& dir) {
    std::cout << "[Test] Embeddable images..." << std::endl;
    const std::string pngPath = dir.file("chart.png");
    const std::string jpgPath = dir.file("photo.jpg");
    const std::string cmykPath = dir.file("print.jpg");
    assert(FileUtils::WriteFileAtomically(pngPath, test::MakePng(10, 6, 6)));
    assert(FileUtils::WriteFileAtomically(jpgPath, test::MakeJpegHeader(32, 16)));
    assert(FileUtils::WriteFileAtomically(cmykPath, test::MakeJpegHeader(8, 8, 4)));

    auto png = infrastructure::pdf::PdfRenderer::LoadImage(pngPath);
    assert(png);
    assert(png->filter.empty());
    assert(png->colorSpace == "DeviceRGB");
    assert(png->data.size() == 10 * 6 * 3);
    assert(png->alpha.size() == 10 * 6);

    auto jpg = infrastructure::pdf::PdfRenderer::LoadImage(jpgPath);
    assert(jpg);
    assert(jpg->filter == "DCTDecode");
    assert(jpg->width == 32 && jpg->height == 16);
    assert(!jpg->invertedCmyk);

    auto cmyk = infrastructure::pdf::PdfRenderer::LoadImage(cmykPath);
    assert(cmyk);
    assert(cmyk->colorSpace == "DeviceCMYK");
    assert(cmyk->invertedCmyk);

    assert(!infrastructure::pdf::PdfRenderer::LoadImage(dir.file("missing.png")));
}

void TestResolver(const test::ScratchDir& dir) {
    std::cout << "[Test] Image path resolution..." << std::endl;
    fs::create_directories(dir.path() / "doc" / "images");
    fs::create_directories(dir.path() / "shared");
    assert(FileUtils::WriteFileAtomically((dir.path() / "doc" / "local.png").string(), test::MakePng(1, 1)));
    assert(FileUtils::WriteFileAtomically((dir.path() / "doc" / "images" / "fig.png").string(), test::MakePng(1, 1)));
    assert(FileUtils::WriteFileAtomically((dir.path() / "shared" / "logo.png").string(), test::MakePng(1, 1)));

    application::ImageResolver resolver({(dir.path() / "doc").string(), "", (dir.path() / "shared").string()});
    assert(resolver.searchRoots().size() == 2);

    auto local = resolver.resolve("./local.png");
    assert(local && fs::path(*local) == dir.path() / "doc" / "local.png");
    auto fig = resolver.resolve("fig.png");
    assert(fig && fs::path(*fig) == dir.path() / "doc" / "images" / "fig.png");
    auto logo = resolver.resolve("logo.png");
    assert(logo && fs::path(*logo) == dir.path() / "shared" / "logo.png");

    const std::string absolute = (dir.path() / "shared" / "logo.png").string();
    assert(resolver.resolve(absolute).value_or("") == absolute);
    assert(resolver.resolve("file://" + absolute).value_or("") == absolute);

    assert(!resolver.resolve("missing.png"));
    assert(!resolver.resolve("https://example.com/a.png"));
    assert(!resolver.resolve(""));
    assert(application::ImageResolver::IsRemote("http://x/y.png"));
    assert(!application::ImageResolver::IsRemote("images/http.png"));
}

} // namespace

int main() {
    std::cout << "[Test] Starting ImageLoader Test..." << std::endl;

    test::ScratchDir dir("docforge_images");
    TestProbe();
    TestDecode();
    TestPdfImageLoading(dir);
    TestResolver(dir);

    std::cout << "[PASS] ImageLoader Test Passed." << std::endl;
    return 0;
}
