/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <fstream>
#include <unistd.h>
#include <gtest/gtest.h>

#include "Net/SocketTable.hpp"
#include "Net/SocketTableSource.hpp"
#include "ProbeConfig.hpp"
#include "ProbeError.hpp"

static constexpr char const* kTcpHeader =
	"  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n";

// 0.0.0.0:135 LISTEN inode 12345, 10.0.0.2:52000 <- 10.0.0.5:4840 ESTABLISHED inode 777
static constexpr char const* kTcp =
	"   0: 00000000:0087 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 12345 1 0 100 0 0 10 0\n"
	"   1: 0200000A:CB20 0500000A:12E8 01 00000000:00000000 00:00000000 00000000  1000        0 777 1 0 20 4 30 10 -1\n"
	"   2: garbage\n";

// [::]:4840 LISTEN inode 4242, ::ffff:10.0.0.2:52001 <- ::ffff:10.0.0.5:4840 SYN_RECV inode 0
static constexpr char const* kTcp6 =
	"   0: 00000000000000000000000000000000:12E8 00000000000000000000000000000000:0000 0A "
	"00000000:00000000 00:00000000 00000000     0        0 4242 1 0 100 0 0 10 0\n"
	"   1: 0000000000000000FFFF00000200000A:CB21 0000000000000000FFFF00000500000A:12E8 03 "
	"00000000:00000000 00:00000000 00000000     0        0 0 1 0 100 0 0 10 0\n";

class ProcNetSocketTableSourceTest : public ::testing::Test
{
protected:
	stdfs::path ProcRoot{};

	void SetUp() override
	{
		ProcRoot = stdfs::temp_directory_path() / fmt::format("lauscher-proc-{}", getpid());
		stdfs::remove_all(ProcRoot);
		stdfs::create_directories(ProcRoot / "net");
	}

	void TearDown() override { stdfs::remove_all(ProcRoot); }

	void WriteFile(stdfs::path const& Path, std::string const& Content)
	{
		std::ofstream File(Path);
		File << Content;
	}
};

TEST_F(ProcNetSocketTableSourceTest, ParseAddressPortDecodesLittleEndianHex)
{
	LIPAddress Address{};
	uint16_t   Port = 0;

	ASSERT_TRUE(LProcNetSocketTableSource::ParseAddressPort("0100007F:0277", Address, Port, false));
	EXPECT_EQ(Address.ToString(), "127.0.0.1");
	EXPECT_EQ(Port, 631);

	ASSERT_TRUE(LProcNetSocketTableSource::ParseAddressPort(
		"0000000000000000FFFF00000500000A:12E8", Address, Port, true));
	EXPECT_TRUE(Address.IsV4Mapped());
	EXPECT_EQ(Address.UnmapV4().ToString(), "10.0.0.5");
	EXPECT_EQ(Port, 4840);

	EXPECT_FALSE(LProcNetSocketTableSource::ParseAddressPort("0100007F", Address, Port, false));
	EXPECT_FALSE(LProcNetSocketTableSource::ParseAddressPort("XYZ0007F:0277", Address, Port, false));
	EXPECT_FALSE(LProcNetSocketTableSource::ParseAddressPort("0100007F:0277", Address, Port, true));
}

TEST_F(ProcNetSocketTableSourceTest, StateNamesFollowNetstat)
{
	EXPECT_EQ(LProcNetSocketTableSource::StateName(0x0A), "LISTENING");
	EXPECT_EQ(LProcNetSocketTableSource::StateName(0x01), "ESTABLISHED");
	EXPECT_EQ(LProcNetSocketTableSource::StateName(0x03), "SYN_RECEIVED");
	EXPECT_EQ(LProcNetSocketTableSource::StateName(0x06), "TIME_WAIT");
	EXPECT_EQ(LProcNetSocketTableSource::StateName(0x42), "UNKNOWN_42");
}

TEST_F(ProcNetSocketTableSourceTest, RenderedTableIsAcceptedByTheSnapshotParser)
{
	WriteFile(ProcRoot / "net" / "tcp", std::string(kTcpHeader) + kTcp);
	WriteFile(ProcRoot / "net" / "tcp6", std::string(kTcpHeader) + kTcp6);

	stdfs::create_directories(ProcRoot / "1234" / "fd");
	stdfs::create_symlink("socket:[12345]", ProcRoot / "1234" / "fd" / "3");
	stdfs::create_symlink("/dev/null", ProcRoot / "1234" / "fd" / "0");

	LProcNetSocketTableSource Source(ProcRoot);
	auto const                Table = Source.Capture();

	auto const Listeners = LSocketTable::ParseListening(Table, Source.GetHeaderLines());
	ASSERT_EQ(Listeners.size(), 2u);
	EXPECT_EQ(Listeners[0].Protocol, "TCP");
	EXPECT_EQ(Listeners[0].Key(), "0.0.0.0:135");
	EXPECT_EQ(Listeners[0].ProcessId, "1234");
	EXPECT_EQ(Listeners[1].Key(), "[::]:4840");
	EXPECT_EQ(Listeners[1].ProcessId, "0");

	auto const Rows = LSocketTable::ParseRows(Table, Source.GetHeaderLines());
	ASSERT_EQ(Rows.size(), 4u);
	EXPECT_EQ(Rows[1].LocalEndpoint, "10.0.0.2:52000");
	EXPECT_EQ(Rows[1].RemoteEndpoint, "10.0.0.5:4840");
	EXPECT_EQ(Rows[1].State, "ESTABLISHED");
	// mapped addresses are shown as plain IPv4
	EXPECT_EQ(Rows[3].RemoteEndpoint, "10.0.0.5:4840");
	EXPECT_EQ(Rows[3].State, "SYN_RECEIVED");
}

TEST_F(ProcNetSocketTableSourceTest, MissingTcp6IsTolerated)
{
	WriteFile(ProcRoot / "net" / "tcp", std::string(kTcpHeader) + kTcp);

	LProcNetSocketTableSource Source(ProcRoot);
	EXPECT_EQ(LSocketTable::ParseRows(Source.Capture(), Source.GetHeaderLines()).size(), 2u);
}

TEST_F(ProcNetSocketTableSourceTest, OverflowingNumbersSkipTheRow)
{
	WriteFile(ProcRoot / "net" / "tcp",
		std::string(kTcpHeader) + kTcp
			+ "   3: 00000000:0050 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 "
			  "99999999999999999999999 1 0 100 0 0 10 0\n"
			+ "   4: 00000000:0051 00000000:0000 1FF 00000000:00000000 00:00000000 00000000     0        0 "
			  "5 1 0 100 0 0 10 0\n");

	stdfs::create_directories(ProcRoot / "1234" / "fd");
	stdfs::create_symlink("socket:[99999999999999999999999]", ProcRoot / "1234" / "fd" / "4");
	stdfs::create_symlink("socket:[12345]", ProcRoot / "1234" / "fd" / "3");
	// not a process
	stdfs::create_directories(ProcRoot / "99999999999999999999");

	LProcNetSocketTableSource Source(ProcRoot);
	std::string               Table{};
	ASSERT_NO_THROW(Table = Source.Capture());

	auto const Listeners = LSocketTable::ParseListening(Table, Source.GetHeaderLines());
	ASSERT_EQ(Listeners.size(), 1u);
	EXPECT_EQ(Listeners[0].Key(), "0.0.0.0:135");
	EXPECT_EQ(Listeners[0].ProcessId, "1234");
}

TEST_F(ProcNetSocketTableSourceTest, NoReadableTableIsACaptureError)
{
	LProcNetSocketTableSource Source(ProcRoot);
	try
	{
		(void)Source.Capture();
		FAIL() << "expected a capture error";
	}
	catch (LProbeError const& e)
	{
		EXPECT_EQ(e.GetKind(), EProbeError::Capture);
	}
}

TEST(CommandSocketTableSourceTest, CapturesStdout)
{
	LCommandSocketTableSource Source("printf 'a\\nb\\n'", 0);
	EXPECT_EQ(Source.Capture(), "a\nb\n");
}

TEST(CommandSocketTableSourceTest, NonZeroExitIsACaptureError)
{
	LCommandSocketTableSource Source("exit 3", 4);
	EXPECT_THROW((void)Source.Capture(), LProbeError);
}

TEST(SocketTableSourceTest, FactoryFollowsSettings)
{
	LProbeSettings Settings{};
	Settings.TableSource = ESocketTableSource::Command;
	Settings.TableCommand = "ss -tan";
	Settings.TableHeaderLines = 1;

	auto const Command = MakeSocketTableSource(Settings);
	EXPECT_EQ(Command->GetHeaderLines(), 1u);
	EXPECT_EQ(Command->GetDescription(), "command 'ss -tan'");

	Settings.TableSource = ESocketTableSource::Proc;
	EXPECT_EQ(MakeSocketTableSource(Settings)->GetHeaderLines(), LProcNetSocketTableSource::kHeaderLines);
}
