#include "core/volume_io.hpp"
#include "core/image_volume_source.hpp"
#include "core/logging.hpp"
#include "core/mrc_volume_source.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include <itkImageFileReader.h>

namespace tomo_viewer::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("VolumeIO");
    return logger;
}

std::string lowerExtension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool isListedExtension(const std::filesystem::path& path) {
    const auto ext = lowerExtension(path);
    return ext == ".mrc" || ext == ".rec" || ext == ".mrcs";
}

std::vector<std::filesystem::path> scanDirectory(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        getLogger()->warn("Cannot scan {}: {}", directory.string(), ec.message());
        return files;
    }
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec) && isListedExtension(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::expected<VolumeHandle, VolumeError>
readWithItk(const std::filesystem::path& path) {
    using ImageType = ImageVolumeSource::ImageType;
    using ReaderType = itk::ImageFileReader<ImageType>;

    auto reader = ReaderType::New();
    reader->SetFileName(path.string());

    try {
        reader->Update();
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(VolumeError{
            VolumeError::Code::ReadFailed,
            path.string() + ": " + e.GetDescription()});
    }

    ImageType::Pointer image = reader->GetOutput();
    image->DisconnectPipeline();

    const auto size = image->GetBufferedRegion().GetSize();
    getLogger()->info("Read {} through ITK ({}x{}x{})",
                      path.filename().string(), size[0], size[1], size[2]);
    return VolumeHandle(std::make_shared<ImageVolumeSource>(
        image, path.filename().string()));
}

}  // anonymous namespace

bool isMrcPath(const std::filesystem::path& path) {
    const auto ext = lowerExtension(path);
    return ext == ".mrc" || ext == ".rec" || ext == ".mrcs" || ext == ".map";
}

std::vector<std::filesystem::path>
listVolumeFiles(const std::filesystem::path& path) {
    const auto absolute = std::filesystem::absolute(path);

    std::error_code ec;
    if (std::filesystem::is_directory(absolute, ec)) {
        return scanDirectory(absolute);
    }

    auto directory = absolute.parent_path();
    if (directory.empty()) {
        directory = std::filesystem::current_path();
    }
    auto files = scanDirectory(directory);
    if (std::filesystem::exists(absolute, ec) &&
        std::find(files.begin(), files.end(), absolute) == files.end()) {
        files.push_back(absolute);
        std::sort(files.begin(), files.end());
    }
    return files;
}

std::expected<VolumeHandle, VolumeError>
openVolume(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(VolumeError{
            VolumeError::Code::FileNotFound, path.string()});
    }

    if (isMrcPath(path)) {
        auto mapped = MrcVolumeSource::open(path);
        if (!mapped) {
            return std::unexpected(mapped.error());
        }
        return VolumeHandle(std::move(*mapped));
    }

    return readWithItk(path);
}

}  // namespace tomo_viewer::core
