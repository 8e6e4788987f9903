#include "core/fact_collector.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/statvfs.h>
#include <unistd.h>
#include <utility>

#include "util/logging.h"
#include "util/text.h"

namespace stratum::core
{
    namespace fs = std::filesystem;

    namespace
    {
        // /proc files report size 0, so read to EOF instead of by size.
        static std::optional<std::string> ReadSmallFile(const std::string &path)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
                return std::nullopt;
            std::ostringstream ss;
            ss << in.rdbuf();
            if (in.bad())
                return std::nullopt;
            return ss.str();
        }

        static std::optional<std::string> FirstLine(const std::optional<std::string> &text)
        {
            if (!text)
                return std::nullopt;
            std::string_view sv(*text);
            sv = util::Trim(sv.substr(0, sv.find('\n')));
            if (sv.empty())
                return std::nullopt;
            return std::string(sv);
        }
    } // namespace

    FactCollector::FactCollector(CollectorOptions opts, std::shared_ptr<SnapshotBackend> backend,
                                 std::shared_ptr<InitImageSystem> init_images)
        : opts_(std::move(opts)), backend_(std::move(backend)), init_images_(std::move(init_images))
    {
    }

    std::string FactCollector::Under(std::string_view path) const
    {
        fs::path root(opts_.sysroot.empty() ? std::string("/") : opts_.sysroot);
        return (root / fs::path(std::string(path)).relative_path()).string();
    }

    bool FactCollector::FindTool(const std::string &name) const
    {
        for (const auto &dir : opts_.tool_path)
        {
            const std::string candidate = Under(dir + "/" + name);
            if (::access(candidate.c_str(), X_OK) == 0)
                return true;
        }
        return false;
    }

    std::optional<uint64_t> FactCollector::BootImageBytes(const std::string &kernel_release) const
    {
        std::string rel = opts_.boot_image_template;
        if (rel.empty())
            return std::nullopt;
        constexpr std::string_view kNeedle = "{kernel}";
        for (std::size_t pos = rel.find(kNeedle); pos != std::string::npos; pos = rel.find(kNeedle, pos))
        {
            rel.replace(pos, kNeedle.size(), kernel_release);
            pos += kernel_release.size();
        }

        std::error_code ec;
        const fs::path image(Under(rel));
        if (!fs::is_regular_file(image, ec))
            return std::nullopt;
        const auto size = fs::file_size(image, ec);
        if (ec || size == 0)
            return std::nullopt;
        return static_cast<uint64_t>(size);
    }

    std::optional<std::string> FactCollector::ParseOsRelease(std::string_view text)
    {
        while (!text.empty())
        {
            std::size_t nl = text.find('\n');
            std::string_view line = util::Trim(text.substr(0, nl));
            text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

            constexpr std::string_view kKey = "VERSION_ID=";
            if (line.substr(0, kKey.size()) != kKey)
                continue;
            std::string_view v = line.substr(kKey.size());
            if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
                v = v.substr(1, v.size() - 2);
            if (v.empty())
                return std::nullopt;
            return std::string(v);
        }
        return std::nullopt;
    }

    SystemFacts FactCollector::Collect() const
    {
        SystemFacts f;

        if (auto text = ReadSmallFile(Under("etc/os-release")))
            f.release = ParseOsRelease(*text);

        f.kernel_release = FirstLine(ReadSmallFile(Under("proc/sys/kernel/osrelease")));
        if (f.kernel_release)
        {
            f.kernel = KernelVersion::Parse(*f.kernel_release);
            f.boot_image_bytes = BootImageBytes(*f.kernel_release);
        }

        f.boot_id = FirstLine(ReadSmallFile(Under("proc/sys/kernel/random/boot_id")));

        f.pool = backend_ ? backend_->Health() : PoolHealth::kAbsent;

        if (init_images_)
        {
            const auto gens = init_images_->ListInstalledGenerators();
            f.tools.init_generator_a = gens.count(opts_.init_generator_a) > 0;
            f.tools.init_generator_b = gens.count(opts_.init_generator_b) > 0;
        }
        else
        {
            f.tools.init_generator_a = FindTool(opts_.init_generator_a);
            f.tools.init_generator_b = FindTool(opts_.init_generator_b);
        }
        f.tools.boot_sync_helper = FindTool(opts_.boot_sync_helper);

        struct statvfs vfs{};
        const std::string root = opts_.sysroot.empty() ? std::string("/") : opts_.sysroot;
        if (::statvfs(root.c_str(), &vfs) == 0)
            f.free_bytes = static_cast<uint64_t>(vfs.f_bavail) * static_cast<uint64_t>(vfs.f_frsize);

        STRATUM_LOG_DEBUG("facts: {}", f.Summary());
        return f;
    }

} // namespace stratum::core
