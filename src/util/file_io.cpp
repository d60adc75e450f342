#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "util/file_io.hpp"
#include "util/log.hpp"

namespace storage
{
namespace fs = std::filesystem;

std::optional<std::vector<std::uint8_t>> read_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        LOG_ERROR("cannot open %s: %s", path.c_str(), std::strerror(errno));
        return std::nullopt;
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
    if (in.bad())
    {
        LOG_ERROR("read error on %s", path.c_str());
        return std::nullopt;
    }
    return data;
}

bool write_file(const std::string &path, const std::vector<std::uint8_t> &data)
{
    if (path.empty())
    {
        LOG_ERROR("empty output path");
        return false;
    }
    std::error_code ec;
    fs::path        p(path);
    if (p.has_parent_path() && !fs::exists(p.parent_path(), ec))
    {
        if (!fs::create_directories(p.parent_path(), ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", p.parent_path().string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }

    const std::string tmp = path + ".part";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            LOG_ERROR("cannot create %s: %s", tmp.c_str(), std::strerror(errno));
            return false;
        }
        out.write(reinterpret_cast<const char *>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out.flush())
        {
            LOG_ERROR("write to %s failed", tmp.c_str());
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, p, ec);
    if (ec)
    {
        LOG_ERROR("rename(%s -> %s) failed: %s", tmp.c_str(), path.c_str(), ec.message().c_str());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

}  // namespace storage
