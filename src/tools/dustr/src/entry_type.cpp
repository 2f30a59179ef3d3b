#include "disk_usage_core.hpp"

#include <cerrno>
#include <sys/stat.h>
#include <sys/types.h>
#include <utility>

namespace dustr::du
{

TypeIndicator classify(const std::filesystem::path &path, std::error_code &ec)
{
    ec.clear();
    struct stat sb{};
    if (::lstat(path.c_str(), &sb) != 0)
    {
        ec.assign(errno, std::generic_category());
        return TypeIndicator::None;
    }

    // A link to a directory is still reported as a link.
    if (S_ISLNK(sb.st_mode))
        return TypeIndicator::Symlink;
    if (S_ISDIR(sb.st_mode))
        return TypeIndicator::Directory;
    return TypeIndicator::None;
}

const char *typeIndicatorSuffix(TypeIndicator indicator) noexcept
{
    switch (indicator)
    {
    case TypeIndicator::Directory:
        return "/";
    case TypeIndicator::Symlink:
        return "@";
    case TypeIndicator::None:
        break;
    }
    return "";
}

std::string displaySuffix(const std::filesystem::path &path, std::optional<ScanError> *failure)
{
    std::error_code ec;
    TypeIndicator indicator = classify(path, ec);
    if (ec)
    {
        if (failure)
        {
            ScanError error;
            error.kind = ScanErrorKind::ClassificationFailed;
            error.message = ec.message();
            error.path = path;
            *failure = std::move(error);
        }
        return {};
    }
    return typeIndicatorSuffix(indicator);
}

} // namespace dustr::du
