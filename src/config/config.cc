#include "config/config.h"

#include <fstream>
#include <stdexcept>

#include "util/logging.h"
#include "util/text.h"

namespace stratum::config
{
    namespace
    {
        static std::vector<std::string> SplitColon(const std::string &s)
        {
            std::vector<std::string> out;
            std::size_t start = 0;
            while (start <= s.size())
            {
                std::size_t c = s.find(':', start);
                if (c == std::string::npos)
                    c = s.size();
                std::string part(util::Trim(std::string_view(s).substr(start, c - start)));
                if (!part.empty())
                    out.push_back(std::move(part));
                start = c + 1;
            }
            return out;
        }

        static uint64_t ToU64(const std::string &val)
        {
            if (val.empty() || val.front() == '-')
                throw std::invalid_argument(val);
            std::size_t used = 0;
            const unsigned long long v = std::stoull(val, &used);
            if (used != val.size())
                throw std::invalid_argument(val);
            return static_cast<uint64_t>(v);
        }
    } // namespace

    Status ApplyKey(const std::string &key, const std::string &val, Config *cfg)
    {
        try
        {
            if (key == "state_dir")
                cfg->state_dir = val;
            else if (key == "pool")
                cfg->pool = val;
            else if (key == "sysroot")
                cfg->collector.sysroot = val;
            else if (key == "source_release")
                cfg->plan.source_release = val;
            else if (key == "interim_release")
                cfg->plan.interim_release = val;
            else if (key == "interim_codename")
                cfg->plan.interim_codename = val;
            else if (key == "target_release")
                cfg->plan.target_release = val;
            else if (key == "target_codename")
                cfg->plan.target_codename = val;
            else if (key == "min_kernel")
            {
                auto k = KernelVersion::Parse(val);
                if (!k)
                    return Status::InvalidArgument("min_kernel: expected major.minor, got '" + val + "'");
                cfg->plan.min_kernel = *k;
            }
            else if (key == "min_free_gb")
                cfg->plan.min_free_bytes = ToU64(val) << 30;
            else if (key == "init_generator_a")
                cfg->collector.init_generator_a = val;
            else if (key == "init_generator_b")
                cfg->collector.init_generator_b = val;
            else if (key == "boot_sync_helper")
                cfg->collector.boot_sync_helper = val;
            else if (key == "boot_image_template")
                cfg->collector.boot_image_template = val;
            else if (key == "tool_path")
                cfg->collector.tool_path = SplitColon(val);
            else if (key == "upgrade_command")
                cfg->upgrade_command = val;
            else if (key == "upgrade_check_command")
                cfg->upgrade_check_command = val;
            else if (key == "regenerate_command")
                cfg->regenerate_command = val;
            else if (key == "regenerate_all_command")
                cfg->regenerate_all_command = val;
            else if (key == "boot_sync_command")
                cfg->boot_sync_command = val;
            else if (key == "log_level")
            {
                util::LogLevel lvl;
                if (!util::ParseLogLevel(val, &lvl))
                    return Status::InvalidArgument("log_level: unknown level '" + val + "'");
                cfg->log_level = val;
            }
            else if (key == "log_path")
                cfg->log_path = val;
            else
                return Status::NotFound("unknown key " + key);
        }
        catch (const std::invalid_argument &)
        {
            return Status::InvalidArgument(key + ": not a number: '" + val + "'");
        }
        catch (const std::out_of_range &)
        {
            return Status::InvalidArgument(key + ": out of range: '" + val + "'");
        }
        return Status::Ok();
    }

    Status LoadConfigFile(const std::string &path, Config *out)
    {
        std::ifstream in(path);
        if (!in)
        {
            STRATUM_LOG_DEBUG("no config at {}, using defaults", path);
            return Status::Ok();
        }

        std::string line;
        int lineno = 0;
        while (std::getline(in, line))
        {
            ++lineno;
            std::string_view sv = util::Trim(line);
            if (sv.empty() || sv.front() == '#')
                continue;

            auto pos = sv.find(':');
            if (pos == std::string_view::npos)
                return Status::InvalidArgument(path + ":" + std::to_string(lineno) + ": expected 'key: value'");

            std::string key(util::Trim(sv.substr(0, pos)));
            std::string val(util::Trim(sv.substr(pos + 1)));
            if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
                val = val.substr(1, val.size() - 2);

            auto st = ApplyKey(key, val, out);
            if (st.code() == ErrorCode::kNotFound)
            {
                STRATUM_LOG_WARN("{}:{}: ignoring unknown key '{}'", path, lineno, key);
                continue;
            }
            if (!st.ok())
                return Status::InvalidArgument(path + ":" + std::to_string(lineno) + ": " + st.message());
        }
        return Status::Ok();
    }

    OrchestratorOptions ToOptions(const Config &cfg)
    {
        OrchestratorOptions opts;
        opts.state_dir = cfg.state_dir;
        opts.plan = cfg.plan;
        opts.collector = cfg.collector;
        return opts;
    }

    Status ApplyLogging(const Config &cfg)
    {
        util::LogLevel lvl;
        if (!util::ParseLogLevel(cfg.log_level, &lvl))
            return Status::InvalidArgument("log_level: unknown level '" + cfg.log_level + "'");
        util::Logger::Instance().SetLevel(lvl);
        if (!cfg.log_path.empty())
            util::Logger::Instance().SetFile(cfg.log_path);
        return Status::Ok();
    }

} // namespace stratum::config
