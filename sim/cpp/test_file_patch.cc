//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for patching iPXE images on disk

#include <catch2/catch.hpp>
#include <hal_posix/file_patch.h>
#include <hal_test/sim_utils.h>
#include <cstdio>

using netboot::ipxe::ExecCompressor;
using netboot::ipxe::ImagePatcher;
using netboot::ipxe::PatchError;

static const std::string MARK_START = "# *PLACEHOLDER START*";
static const std::string MARK_END   = "# *PLACEHOLDER END*";
static const std::string SCRIPT     = "#!ipxe\nchain http://10.0.0.1:50042/ipxe\n";

// Synthetic image with a placeholder of the requested size.
static std::string make_image(const char* tag, unsigned space = 256) {
    return std::string("BIN:") + tag + "\n" + MARK_START
         + std::string(space, ' ') + MARK_END + "\n:END";
}

// Compressor that records its inputs and returns a fixed result.
class MockCompressor final : public netboot::ipxe::Compressor {
public:
    explicit MockCompressor(bool ok) : m_ok(ok), m_calls(0) {}
    bool compress(const char* raw, const char* info, std::string& out) override {
        ++m_calls;
        m_raw = raw;
        m_info = info;
        out = m_ok ? "compressed" : "";
        return m_ok;
    }
    unsigned calls() const {return m_calls;}
    const std::string& raw() const {return m_raw;}
    const std::string& info() const {return m_info;}
protected:
    const bool m_ok;
    unsigned m_calls;
    std::string m_raw, m_info;
};

static PatchError patch(ImagePatcher& uut, const std::string& src, const std::string& dst) {
    return uut.patch_file(src.c_str(), dst.c_str(),
        (const u8*)SCRIPT.data(), (unsigned)SCRIPT.size());
}

TEST_CASE("file-patch") {
    NETBOOT_TEST_START;
    netboot::test::TempDir tmp;
    MockCompressor codec(true);
    ImagePatcher uut(&codec);

    SECTION("basic") {
        const std::string image = make_image("efi");
        REQUIRE(tmp.write("ipxe/amd64/ipxe.efi", image));
        CHECK(patch(uut, tmp.file("ipxe/amd64/ipxe.efi"), tmp.file("tftp/sub/ipxe.efi"))
            == PatchError::NONE);
        std::string out = tmp.read("tftp/sub/ipxe.efi");
        CHECK(out.size() == image.size());
        CHECK(out.find(SCRIPT) == 8);
        CHECK(out.find(MARK_START) == std::string::npos);
        // Source is left unmodified.
        CHECK(tmp.read("ipxe/amd64/ipxe.efi") == image);
    }

    SECTION("no-start") {
        log.suppress("failed to patch");
        REQUIRE(tmp.write("bad.efi", "binary" + MARK_END));
        CHECK(patch(uut, tmp.file("bad.efi"), tmp.file("out/bad.efi"))
            == PatchError::NO_START);
        CHECK(log.contains("placeholder start not found"));
        CHECK_FALSE(tmp.exists("out/bad.efi"));
    }

    SECTION("too-long") {
        // The window spans both markers, so an empty placeholder still
        // holds exactly this many bytes.
        const unsigned window = MARK_START.size() + MARK_END.size();
        const std::string fits(window, 'x');
        const std::string over(window + 1, 'x');
        REQUIRE(tmp.write("small.efi", make_image("x", 0)));
        CHECK(uut.patch_file(tmp.file("small.efi").c_str(), tmp.file("fits.out").c_str(),
            (const u8*)fits.data(), (unsigned)fits.size()) == PatchError::NONE);
        CHECK(tmp.exists("fits.out"));
        log.suppress("failed to patch");
        CHECK(uut.patch_file(tmp.file("small.efi").c_str(), tmp.file("small.out").c_str(),
            (const u8*)over.data(), (unsigned)over.size()) == PatchError::SCRIPT_TOO_LONG);
        CHECK(log.contains("is larger than placeholder space"));
        CHECK_FALSE(tmp.exists("small.out"));
    }

    SECTION("missing-source") {
        log.suppress("failed to read");
        CHECK(patch(uut, tmp.file("missing.efi"), tmp.file("out.efi"))
            == PatchError::READ_FAILED);
        CHECK_FALSE(tmp.exists("out.efi"));
    }

    SECTION("unwritable") {
        // A regular file where a directory is expected.
        log.suppress("failed to create");
        REQUIRE(tmp.write("ipxe.efi", make_image("efi")));
        REQUIRE(tmp.write("blocker", "x"));
        CHECK(patch(uut, tmp.file("ipxe.efi"), tmp.file("blocker/ipxe.efi"))
            == PatchError::WRITE_FAILED);
    }

    SECTION("compress") {
        REQUIRE(tmp.write("raw.bin", "raw"));
        CHECK(uut.compress_file(tmp.file("raw.bin").c_str(),
            tmp.file("raw.zinfo").c_str(), tmp.file("tftp/out.kpxe").c_str())
            == PatchError::NONE);
        CHECK(tmp.read("tftp/out.kpxe") == "compressed");
        CHECK(codec.raw() == tmp.file("raw.bin"));
        CHECK(codec.info() == tmp.file("raw.zinfo"));
    }

    SECTION("compress-failed") {
        log.suppress("failed to compress");
        MockCompressor fail(false);
        ImagePatcher uut2(&fail);
        CHECK(uut2.compress_file(tmp.file("raw.bin").c_str(),
            tmp.file("raw.zinfo").c_str(), tmp.file("out.kpxe").c_str())
            == PatchError::COMPRESS_FAILED);
        CHECK_FALSE(tmp.exists("out.kpxe"));
    }
}

TEST_CASE("file-patch-all") {
    NETBOOT_TEST_START;
    log.suppress("successfully patched");
    netboot::test::TempDir tmp;
    REQUIRE(tmp.write("ipxe/amd64/ipxe.efi", make_image("x86-ipxe")));
    REQUIRE(tmp.write("ipxe/amd64/snp.efi", make_image("x86-snp")));
    REQUIRE(tmp.write("ipxe/arm64/ipxe.efi", make_image("arm-ipxe")));
    REQUIRE(tmp.write("ipxe/arm64/snp.efi", make_image("arm-snp")));
    REQUIRE(tmp.write("ipxe/amd64/kpxe/undionly.kpxe.bin", make_image("kpxe")));
    REQUIRE(tmp.write("ipxe/amd64/kpxe/undionly.kpxe.zinfo", "ZINF"));
    const std::string ipxe = tmp.file("ipxe");
    const std::string tftp = tmp.file("tftp");

    SECTION("complete") {
        // "cat RAW INFO" stands in for the real compressor.
        ExecCompressor codec("/bin/cat");
        ImagePatcher uut(&codec);
        CHECK(uut.patch_all(ipxe.c_str(), tftp.c_str(),
            (const u8*)SCRIPT.data(), (unsigned)SCRIPT.size()));
        CHECK(log.contains("successfully patched iPXE binaries"));
        CHECK(tmp.read("tftp/ipxe.efi").find("x86-ipxe\n" + SCRIPT) == 4);
        CHECK(tmp.read("tftp/snp.efi").find("x86-snp\n" + SCRIPT) == 4);
        CHECK(tmp.read("tftp/ipxe-arm64.efi").find("arm-ipxe\n" + SCRIPT) == 4);
        CHECK(tmp.read("tftp/snp-arm64.efi").find("arm-snp\n" + SCRIPT) == 4);
        // Legacy image is patched in place, then compressed twice.
        const std::string patched = tmp.read("ipxe/amd64/kpxe/undionly.kpxe.bin.patched");
        CHECK(patched.find("kpxe\n" + SCRIPT) == 4);
        CHECK(tmp.read("tftp/undionly.kpxe") == patched + "ZINF");
        CHECK(tmp.read("tftp/undionly.kpxe.0") == patched + "ZINF");
    }

    SECTION("missing-image") {
        log.suppress("failed to read");
        MockCompressor codec(true);
        ImagePatcher uut(&codec);
        REQUIRE(remove(tmp.file("ipxe/arm64/snp.efi").c_str()) == 0);
        CHECK_FALSE(uut.patch_all(ipxe.c_str(), tftp.c_str(),
            (const u8*)SCRIPT.data(), (unsigned)SCRIPT.size()));
        CHECK_FALSE(tmp.exists("tftp/snp-arm64.efi"));
        CHECK(codec.calls() == 0);
    }

    SECTION("compress-failed") {
        log.suppress("failed to compress");
        MockCompressor codec(false);
        ImagePatcher uut(&codec);
        CHECK_FALSE(uut.patch_all(ipxe.c_str(), tftp.c_str(),
            (const u8*)SCRIPT.data(), (unsigned)SCRIPT.size()));
        CHECK(codec.calls() == 1);
        CHECK_FALSE(tmp.exists("tftp/undionly.kpxe"));
        CHECK_FALSE(tmp.exists("tftp/undionly.kpxe.0"));
    }
}
