#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>

#include "stratum/options.h"

namespace stratum::test
{

    // Writes the handful of files the fact collector reads under a temporary
    // root: etc/os-release, the kernel release, the boot id, boot images and
    // tool stubs.
    class FakeSysroot
    {
    public:
        explicit FakeSysroot(std::string root) : root_(std::move(root))
        {
            std::filesystem::create_directories(root_ + "/etc");
            std::filesystem::create_directories(root_ + "/proc/sys/kernel/random");
            std::filesystem::create_directories(root_ + "/usr/sbin");
            std::filesystem::create_directories(root_ + "/boot");
        }

        const std::string &root() const { return root_; }

        void SetRelease(const std::string &version_id)
        {
            WriteFile("etc/os-release", "NAME=\"Ubuntu\"\nVERSION_ID=\"" + version_id +
                                            "\"\nID=ubuntu\nPRETTY_NAME=\"Ubuntu " + version_id + "\"\n");
        }

        void SetKernel(const std::string &release) { WriteFile("proc/sys/kernel/osrelease", release + "\n"); }
        void SetBootId(const std::string &id) { WriteFile("proc/sys/kernel/random/boot_id", id + "\n"); }

        void InstallTool(const std::string &name)
        {
            const std::string path = root_ + "/usr/sbin/" + name;
            WriteFile("usr/sbin/" + name, "#!/bin/sh\nexit 0\n");
            ::chmod(path.c_str(), 0755);
        }

        // What a generator leaves behind for `kernel_release`.
        void InstallBootImage(const std::string &kernel_release)
        {
            WriteFile("boot/initrd.img-" + kernel_release, "initramfs image\n");
        }

        void RemoveTool(const std::string &name)
        {
            std::error_code ec;
            std::filesystem::remove(root_ + "/usr/sbin/" + name, ec);
        }

        void WriteFile(const std::string &rel, const std::string &content)
        {
            std::ofstream out(root_ + "/" + rel, std::ios::binary | std::ios::trunc);
            out << content;
        }

        // Collector options resolving everything under this root.
        CollectorOptions Options() const
        {
            CollectorOptions o;
            o.sysroot = root_;
            o.tool_path = {"/usr/sbin"};
            return o;
        }

    private:
        std::string root_;
    };

} // namespace stratum::test
