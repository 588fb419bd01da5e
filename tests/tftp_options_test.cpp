#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <tftpclient/tftp_options.h>
#include <tftpclient/tftp_validation.h>

using namespace tftpclient;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class TftpOptionsTest : public ::testing::Test {
protected:
    OptionSet options_;
};

TEST_F(TftpOptionsTest, EmptyByDefault) {
    EXPECT_TRUE(options_.Empty());
    EXPECT_FALSE(options_.GetBlockSize());
    EXPECT_FALSE(options_.GetTransferSize());
    EXPECT_THAT(options_.ToOptionList(), IsEmpty());
}

TEST_F(TftpOptionsTest, BlockSizeRangeIsEnforced) {
    EXPECT_NO_THROW(options_.SetBlockSize(8));
    EXPECT_EQ(*options_.GetBlockSize(), 8);
    EXPECT_NO_THROW(options_.SetBlockSize(65464));
    EXPECT_EQ(*options_.GetBlockSize(), 65464);

    EXPECT_THROW(options_.SetBlockSize(7), TftpException);
    EXPECT_THROW(options_.SetBlockSize(65465), TftpException);
    EXPECT_THROW(options_.SetBlockSize(0), TftpException);
    EXPECT_THROW(options_.SetBlockSize(-512), TftpException);

    // A rejected value leaves the previous one in place
    EXPECT_EQ(*options_.GetBlockSize(), 65464);
}

TEST_F(TftpOptionsTest, NegativeTransferSizeIsRejected) {
    EXPECT_THROW(options_.SetTransferSize(-1), TftpException);
    EXPECT_FALSE(options_.GetTransferSize());

    EXPECT_NO_THROW(options_.SetTransferSize(0));
    EXPECT_EQ(*options_.GetTransferSize(), 0u);
    EXPECT_NO_THROW(options_.SetTransferSize(5000000000LL));
    EXPECT_EQ(*options_.GetTransferSize(), 5000000000ULL);
}

TEST_F(TftpOptionsTest, OptionListOrderIsBlockSizeThenTransferSize) {
    options_.SetTransferSize(3000);
    options_.SetBlockSize(1024);

    EXPECT_THAT(options_.ToOptionList(),
                ElementsAre(Option("blksize", "1024"), Option("tsize", "3000")));
}

TEST_F(TftpOptionsTest, OnlyPresentOptionsAreListed) {
    options_.SetTransferSize(0);
    EXPECT_THAT(options_.ToOptionList(), ElementsAre(Option("tsize", "0")));

    options_.ClearTransferSize();
    options_.SetBlockSize(512);
    EXPECT_THAT(options_.ToOptionList(), ElementsAre(Option("blksize", "512")));

    options_.ClearBlockSize();
    EXPECT_TRUE(options_.Empty());
}

TEST_F(TftpOptionsTest, FromOptionListMatchesNamesCaseInsensitively) {
    OptionSet parsed = OptionSet::FromOptionList({{"BLKSIZE", "1428"}, {"TSize", "99"}});

    ASSERT_TRUE(parsed.GetBlockSize());
    EXPECT_EQ(*parsed.GetBlockSize(), 1428);
    ASSERT_TRUE(parsed.GetTransferSize());
    EXPECT_EQ(*parsed.GetTransferSize(), 99u);
}

TEST_F(TftpOptionsTest, FromOptionListDropsInvalidAndUnknownEntries) {
    OptionSet parsed = OptionSet::FromOptionList({
        {"blksize", "4"},
        {"tsize", "-5"},
        {"timeout", "3"},
    });
    EXPECT_TRUE(parsed.Empty());

    parsed = OptionSet::FromOptionList({{"blksize", "abc"}, {"blksize", "70000"}});
    EXPECT_FALSE(parsed.GetBlockSize());
}

TEST_F(TftpOptionsTest, NegotiateWithoutGrantedOptionsGivesDefaults) {
    NegotiatedOptions negotiated = options_.Negotiate();
    EXPECT_EQ(negotiated.blksize, kDefaultBlockSize);
    EXPECT_EQ(negotiated.tsize, kDefaultTransferSize);

    NegotiatedOptions defaults = OptionSet::Defaults();
    EXPECT_EQ(defaults.blksize, 512);
    EXPECT_EQ(defaults.tsize, 0u);
}

TEST_F(TftpOptionsTest, NegotiateOverridesOnlyGrantedOptions) {
    // OACK granting only blksize: tsize stays at its default
    NegotiatedOptions negotiated = OptionSet::FromOptionList({{"blksize", "1024"}}).Negotiate();
    EXPECT_EQ(negotiated.blksize, 1024);
    EXPECT_EQ(negotiated.tsize, 0u);

    negotiated = OptionSet::FromOptionList({{"tsize", "2048"}}).Negotiate();
    EXPECT_EQ(negotiated.blksize, 512);
    EXPECT_EQ(negotiated.tsize, 2048u);
}

TEST_F(TftpOptionsTest, Equality) {
    OptionSet other;
    EXPECT_EQ(options_, other);

    options_.SetBlockSize(1024);
    EXPECT_FALSE(options_ == other);

    other.SetBlockSize(1024);
    EXPECT_EQ(options_, other);
}

TEST(TftpValidationTest, HostAndFilename) {
    EXPECT_TRUE(validation::ValidateHost("127.0.0.1"));
    EXPECT_TRUE(validation::ValidateHost("192.168.100.254"));
    EXPECT_FALSE(validation::ValidateHost(""));
    EXPECT_FALSE(validation::ValidateHost("localhost"));
    EXPECT_FALSE(validation::ValidateHost("256.0.0.1"));
    EXPECT_FALSE(validation::ValidateHost("1.2.3"));

    EXPECT_TRUE(validation::ValidateFilename("boot/pxelinux.0"));
    EXPECT_FALSE(validation::ValidateFilename(""));
    EXPECT_FALSE(validation::ValidateFilename(std::string(256, 'a')));
    EXPECT_FALSE(validation::ValidateFilename(std::string("a\0b", 3)));
    EXPECT_FALSE(validation::ValidateFilename("caf\xC3\xA9"));
}

TEST(TftpValidationTest, PortAndTimeout) {
    EXPECT_FALSE(validation::ValidatePort(0));
    EXPECT_TRUE(validation::ValidatePort(69));
    EXPECT_TRUE(validation::ValidatePort(65535));

    EXPECT_TRUE(validation::ValidateTimeout(0));
    EXPECT_TRUE(validation::ValidateTimeout(3600000));
    EXPECT_FALSE(validation::ValidateTimeout(-1));
    EXPECT_FALSE(validation::ValidateTimeout(3600001));
}
