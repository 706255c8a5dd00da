#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <memory>

namespace {

struct MagicCloser {
    void operator()(magic_set* m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<magic_set, MagicCloser>;

} // namespace

std::string shrink::MimeDetector::detect(const std::filesystem::path& path)
{
    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return {};
    if (magic_load(magic.get(), nullptr) != 0)
    {
        Logger::log(LogLevel::Warning,
                    std::string("magic_load failed: ") + magic_error(magic.get()),
                    "libmagic");
        return {};
    }
    const char* mime = magic_file(magic.get(), path.string().c_str());
    return mime ? mime : "";
}
