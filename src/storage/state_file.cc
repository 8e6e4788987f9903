#include "storage/state_file.h"

#include <filesystem>
#include <string>
#include <vector>

#include "util/crc32c.h"
#include "util/logging.h"
#include "util/posix_file.h"
#include "util/text.h"

namespace stratum::storage
{
    namespace fs = std::filesystem;

    namespace
    {
        constexpr std::string_view kHeaderPrefix = "stratum.state.v";

        static Status ReadChecked(const std::string &path, std::string *out)
        {
            util::PosixFile f;
            auto st = util::PosixFile::OpenRead(path, &f);
            if (!st.ok())
                return st;

            std::string buf;
            st = f.ReadAll(&buf);
            if (!st.ok())
                return st;

            if (buf.size() < 4)
                return Status::Corruption("state record too short for CRC");

            const std::size_t content_len = buf.size() - 4;
            const auto *t = reinterpret_cast<const unsigned char *>(buf.data() + content_len);
            const uint32_t stored = static_cast<uint32_t>(t[0]) |
                                    (static_cast<uint32_t>(t[1]) << 8) |
                                    (static_cast<uint32_t>(t[2]) << 16) |
                                    (static_cast<uint32_t>(t[3]) << 24);
            if (util::Crc32c(buf.data(), content_len) != stored)
                return Status::Corruption("state record CRC mismatch");

            buf.resize(content_len);
            *out = std::move(buf);
            return Status::Ok();
        }

        static Status AtomicWriteFile(const std::string &final_path, std::string_view content)
        {
            const std::string tmp = final_path + ".tmp";

            util::PosixFile pf;
            auto st = util::PosixFile::CreateTrunc(tmp, &pf);
            if (!st.ok())
                return st;

            st = pf.Append(content.data(), content.size());
            if (!st.ok())
                return st;

            const uint32_t crc = util::Crc32c(content.data(), content.size());
            const char crc_buf[4] = {
                static_cast<char>(crc & 0xFF),
                static_cast<char>((crc >> 8) & 0xFF),
                static_cast<char>((crc >> 16) & 0xFF),
                static_cast<char>((crc >> 24) & 0xFF),
            };
            st = pf.Append(crc_buf, sizeof(crc_buf));
            if (!st.ok())
                return st;

            // Data must be durable before the rename publishes it.
            st = pf.SyncData();
            if (!st.ok())
                return st;
            st = pf.Close();
            if (!st.ok())
                return st;

            return util::RenameDurably(tmp, final_path);
        }

        static Status ParsePhaseTok(std::string_view tok, Phase *out)
        {
            auto p = ParsePhase(tok);
            if (!p)
                return Status::Corruption("unknown phase: " + std::string(tok));
            *out = *p;
            return Status::Ok();
        }

        static Status ParseNum(std::string_view tok, uint64_t *out)
        {
            if (!util::ParseU64(tok, out))
                return Status::Corruption("bad number: " + std::string(tok));
            return Status::Ok();
        }

        static Status ParseFlag(std::string_view tok, bool *out)
        {
            if (tok == "1")
                *out = true;
            else if (tok == "0")
                *out = false;
            else
                return Status::Corruption("bad flag: " + std::string(tok));
            return Status::Ok();
        }

        static Status ParseText(std::string_view tok, std::string *out)
        {
            if (!util::UnescapeField(tok, out))
                return Status::Corruption("bad escaped field");
            return Status::Ok();
        }

#define STRATUM_RETURN_IF_ERROR(expr) \
    do                                \
    {                                 \
        auto _st = (expr);            \
        if (!_st.ok())                \
            return _st;               \
    } while (0)

        static Status ParsePending(const std::vector<std::string_view> &t, PendingAction *p)
        {
            if (t.size() != 9)
                return Status::Corruption("pending: expected 8 fields");
            auto kind = ParseActionKind(t[1]);
            if (!kind)
                return Status::Corruption("pending: unknown action " + std::string(t[1]));
            p->kind = *kind;
            STRATUM_RETURN_IF_ERROR(ParsePhaseTok(t[2], &p->from));
            STRATUM_RETURN_IF_ERROR(ParsePhaseTok(t[3], &p->to));
            STRATUM_RETURN_IF_ERROR(ParseText(t[4], &p->target));
            STRATUM_RETURN_IF_ERROR(ParseText(t[5], &p->boot_id));
            STRATUM_RETURN_IF_ERROR(ParseNum(t[6], &p->issued_at));
            STRATUM_RETURN_IF_ERROR(ParseFlag(t[7], &p->reboot_after));
            STRATUM_RETURN_IF_ERROR(ParseFlag(t[8], &p->applied));
            return Status::Ok();
        }

        static Status ParseHistory(const std::vector<std::string_view> &t, HistoryEntry *h)
        {
            if (t.size() != 7)
                return Status::Corruption("history: expected 6 fields");
            STRATUM_RETURN_IF_ERROR(ParseNum(t[1], &h->timestamp));
            STRATUM_RETURN_IF_ERROR(ParsePhaseTok(t[2], &h->from));
            STRATUM_RETURN_IF_ERROR(ParsePhaseTok(t[3], &h->to));
            auto ev = ParseHistoryEvent(t[4]);
            if (!ev)
                return Status::Corruption("history: unknown event " + std::string(t[4]));
            h->event = *ev;
            STRATUM_RETURN_IF_ERROR(ParseText(t[5], &h->detail));
            STRATUM_RETURN_IF_ERROR(ParseText(t[6], &h->facts));
            return Status::Ok();
        }
    } // namespace

    std::string StateFile::Path(std::string_view state_dir)
    {
        return (fs::path(std::string(state_dir)) / "STATE").string();
    }

    std::string StateFile::Serialize(const MigrationState &s)
    {
        std::string out;
        out += kHeaderPrefix;
        out += std::to_string(kSchemaVersion);
        out += '\n';

        out += "run " + util::EscapeField(s.run_id) + "\n";
        out += "phase " + std::string(PhaseName(s.current_phase)) + "\n";

        if (s.last_checkpoint_group)
        {
            out += "last_group " + util::EscapeField(s.last_checkpoint_group->label) + " " +
                   std::to_string(s.last_checkpoint_group->created_at) + "\n";
        }

        if (s.pending)
        {
            const PendingAction &p = *s.pending;
            out += "pending ";
            out += ActionKindName(p.kind);
            out += " ";
            out += PhaseName(p.from);
            out += " ";
            out += PhaseName(p.to);
            out += " " + util::EscapeField(p.target);
            out += " " + util::EscapeField(p.boot_id);
            out += " " + std::to_string(p.issued_at);
            out += p.reboot_after ? " 1" : " 0";
            out += p.applied ? " 1" : " 0";
            out += "\n";
        }

        for (const auto &h : s.history)
        {
            out += "history " + std::to_string(h.timestamp);
            out += " ";
            out += PhaseName(h.from);
            out += " ";
            out += PhaseName(h.to);
            out += " ";
            out += HistoryEventName(h.event);
            out += " " + util::EscapeField(h.detail);
            out += " " + util::EscapeField(h.facts);
            out += "\n";
        }
        return out;
    }

    Status StateFile::Parse(std::string_view content, MigrationState *out)
    {
        *out = MigrationState{};

        std::size_t nl = content.find('\n');
        std::string_view header = content.substr(0, nl);
        if (header.substr(0, kHeaderPrefix.size()) != kHeaderPrefix)
            return Status::Corruption("bad state header");
        uint64_t version = 0;
        if (!util::ParseU64(header.substr(kHeaderPrefix.size()), &version) || version == 0)
            return Status::Corruption("bad state schema version");
        if (version > kSchemaVersion)
            return Status::NotSupported("state schema v" + std::to_string(version) + " is newer than this build");
        out->schema_version = static_cast<uint32_t>(version);

        bool saw_run = false;
        bool saw_phase = false;
        std::string_view rest = (nl == std::string_view::npos) ? std::string_view{} : content.substr(nl + 1);
        while (!rest.empty())
        {
            nl = rest.find('\n');
            std::string_view line = rest.substr(0, nl);
            rest = (nl == std::string_view::npos) ? std::string_view{} : rest.substr(nl + 1);

            auto t = util::SplitWs(line);
            if (t.empty())
                continue;

            if (t[0] == "run" && t.size() == 2)
            {
                STRATUM_RETURN_IF_ERROR(ParseText(t[1], &out->run_id));
                saw_run = true;
            }
            else if (t[0] == "phase" && t.size() == 2)
            {
                STRATUM_RETURN_IF_ERROR(ParsePhaseTok(t[1], &out->current_phase));
                saw_phase = true;
            }
            else if (t[0] == "last_group" && t.size() == 3)
            {
                CheckpointKey k;
                STRATUM_RETURN_IF_ERROR(ParseText(t[1], &k.label));
                STRATUM_RETURN_IF_ERROR(ParseNum(t[2], &k.created_at));
                out->last_checkpoint_group = std::move(k);
            }
            else if (t[0] == "pending")
            {
                PendingAction p;
                STRATUM_RETURN_IF_ERROR(ParsePending(t, &p));
                out->pending = std::move(p);
            }
            else if (t[0] == "history")
            {
                HistoryEntry h;
                STRATUM_RETURN_IF_ERROR(ParseHistory(t, &h));
                out->history.push_back(std::move(h));
            }
            else
            {
                return Status::Corruption("unexpected state line: " + std::string(t[0]));
            }
        }

        if (!saw_run || !saw_phase)
            return Status::Corruption("state record missing run or phase");
        return Status::Ok();
    }

#undef STRATUM_RETURN_IF_ERROR

    Status StateFile::Load(std::string_view state_dir, MigrationState *out)
    {
        std::string content;
        auto st = ReadChecked(Path(state_dir), &content);
        if (!st.ok())
            return st;
        return Parse(content, out);
    }

    Status StateFile::Save(std::string_view state_dir, const MigrationState &state)
    {
        std::error_code ec;
        fs::create_directories(std::string(state_dir), ec);
        if (ec)
            return Status::IOError("create " + std::string(state_dir) + ": " + ec.message());

        auto st = AtomicWriteFile(Path(state_dir), Serialize(state));
        if (!st.ok())
        {
            STRATUM_LOG_ERROR("state write failed: {}", st.ToString());
            return st;
        }
        STRATUM_LOG_DEBUG("state saved: run={} phase={} history={}", state.run_id,
                          PhaseName(state.current_phase), state.history.size());
        return Status::Ok();
    }

} // namespace stratum::storage
