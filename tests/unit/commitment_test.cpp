#include "securevault/core/Commitment.hpp"
#include "securevault/crypto/providers/OpenSslProviderFactory.hpp"
#include "test_utils/CryptoDoubles.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>

namespace
{

using securevault::core::CommitmentScheme;
using securevault::core::makeCommitment;
using securevault::core::verifyCommitment;
using securevault::core::VaultError;
using securevault::security::secureStringFrom;

class CommitmentTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = securevault::crypto::providers::makeOpenSslCryptoProvider();
    }

    [[nodiscard]] std::string commit(std::string_view pass, CommitmentScheme scheme)
    {
        auto res{ makeCommitment(*m_crypto, secureStringFrom(pass), scheme) };
        EXPECT_FALSE(securevault::core::isError(res));
        if (securevault::core::isError(res))
        {
            return {};
        }
        return std::get<std::string>(res);
    }

    std::unique_ptr<securevault::crypto::ICryptoProvider> m_crypto; // NOLINT
};

} // namespace

TEST(CommitmentScheme, NamesRoundTrip)
{
    EXPECT_EQ(securevault::core::toString(CommitmentScheme::Sha256), "sha256");
    EXPECT_EQ(securevault::core::toString(CommitmentScheme::Pbkdf2Sha256), "pbkdf2-sha256");
    EXPECT_EQ(securevault::core::parseCommitmentScheme("sha256"), CommitmentScheme::Sha256);
    EXPECT_EQ(securevault::core::parseCommitmentScheme("pbkdf2-sha256"), CommitmentScheme::Pbkdf2Sha256);
    EXPECT_FALSE(securevault::core::parseCommitmentScheme("SHA256").has_value());
    EXPECT_FALSE(securevault::core::parseCommitmentScheme("").has_value());
}

TEST_F(CommitmentTest, Sha256IsBase64OfDigest)
{
    // SHA-256("abc")
    EXPECT_EQ(commit("abc", CommitmentScheme::Sha256), "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=");
}

TEST_F(CommitmentTest, Sha256IsDeterministic)
{
    EXPECT_EQ(commit("Tr0ub4dor&3", CommitmentScheme::Sha256), commit("Tr0ub4dor&3", CommitmentScheme::Sha256));
}

TEST_F(CommitmentTest, VerifiesMatchingPassphraseForBothSchemes)
{
    for (const auto scheme : { CommitmentScheme::Sha256, CommitmentScheme::Pbkdf2Sha256 })
    {
        const auto stored{ commit("Tr0ub4dor&3", scheme) };
        EXPECT_TRUE(verifyCommitment(*m_crypto, stored, secureStringFrom("Tr0ub4dor&3")));
        EXPECT_FALSE(verifyCommitment(*m_crypto, stored, secureStringFrom("WrongPass")));
        EXPECT_FALSE(verifyCommitment(*m_crypto, stored, secureStringFrom("")));
    }
}

TEST_F(CommitmentTest, Pbkdf2FormatIsSelfDescribing)
{
    const auto stored{ commit("pw", CommitmentScheme::Pbkdf2Sha256) };
    EXPECT_THAT(stored, ::testing::StartsWith("pbkdf2-sha256$100000$"));
    EXPECT_NE(stored, commit("pw", CommitmentScheme::Pbkdf2Sha256));
}

TEST_F(CommitmentTest, CorruptedStoredValueNeverVerifies)
{
    const auto pass{ secureStringFrom("pw") };
    const auto good{ commit("pw", CommitmentScheme::Pbkdf2Sha256) };

    EXPECT_FALSE(verifyCommitment(*m_crypto, "", pass));
    EXPECT_FALSE(verifyCommitment(*m_crypto, "not base64", pass));
    EXPECT_FALSE(verifyCommitment(*m_crypto, "QUJD", pass));
    EXPECT_FALSE(verifyCommitment(*m_crypto, "pbkdf2-sha256$", pass));
    EXPECT_FALSE(verifyCommitment(*m_crypto, "pbkdf2-sha256$100000$", pass));
    EXPECT_FALSE(verifyCommitment(*m_crypto, good.substr(0, good.size() - 4U), pass));

    std::string lowIterations{ good };
    lowIterations.replace(lowIterations.find("100000"), 6U, "1000");
    EXPECT_FALSE(verifyCommitment(*m_crypto, lowIterations, pass));

    std::string junkIterations{ good };
    junkIterations.replace(junkIterations.find("100000"), 6U, "10000x");
    EXPECT_FALSE(verifyCommitment(*m_crypto, junkIterations, pass));
}

TEST(CommitmentFaults, RandomFailureSurfaces)
{
    securevault::test_utils::FaultyCryptoProvider crypto{};
    crypto.failRandom = true;
    const auto res{ makeCommitment(crypto, secureStringFrom("pw"), CommitmentScheme::Pbkdf2Sha256) };
    ASSERT_TRUE(securevault::core::isError(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::RandomFailed);

    EXPECT_FALSE(securevault::core::isError(makeCommitment(crypto, secureStringFrom("pw"), CommitmentScheme::Sha256)));
}

TEST(CommitmentFaults, KdfFailureReadsAsMismatchOrCryptoError)
{
    securevault::test_utils::FaultyCryptoProvider crypto{};
    const auto made{ makeCommitment(crypto, secureStringFrom("pw"), CommitmentScheme::Pbkdf2Sha256) };
    ASSERT_FALSE(securevault::core::isError(made));

    crypto.failDerive = true;
    EXPECT_FALSE(verifyCommitment(crypto, std::get<std::string>(made), secureStringFrom("pw")));

    const auto res{ makeCommitment(crypto, secureStringFrom("pw"), CommitmentScheme::Pbkdf2Sha256) };
    ASSERT_TRUE(securevault::core::isError(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::CryptoError);
}

TEST(CommitmentFaults, UnreadableCommitmentStillDerives)
{
    securevault::test_utils::FaultyCryptoProvider crypto{};
    const auto pass{ secureStringFrom("pw") };

    for (const std::string_view corrupt : { "pbkdf2-sha256$", "pbkdf2-sha256$100000$AAAA$AAAA", "pbkdf2-sha256$1$$" })
    {
        crypto.deriveCalls = 0;
        EXPECT_FALSE(verifyCommitment(crypto, corrupt, pass)) << corrupt;
        EXPECT_EQ(crypto.deriveCalls.load(), 1) << corrupt;
    }

    for (const std::string_view corrupt : { "", "QUJD", "not base64" })
    {
        crypto.sha256Calls = 0;
        EXPECT_FALSE(verifyCommitment(crypto, corrupt, pass)) << corrupt;
        EXPECT_EQ(crypto.sha256Calls.load(), 1) << corrupt;
    }
}

TEST(CommitmentFaults, RejectPassphraseMatchesSchemeCost)
{
    securevault::test_utils::FaultyCryptoProvider crypto{};
    securevault::core::rejectPassphrase(crypto, secureStringFrom("pw"), CommitmentScheme::Pbkdf2Sha256);
    EXPECT_EQ(crypto.deriveCalls.load(), 1);
    EXPECT_EQ(crypto.sha256Calls.load(), 0);

    securevault::core::rejectPassphrase(crypto, secureStringFrom("pw"), CommitmentScheme::Sha256);
    EXPECT_EQ(crypto.deriveCalls.load(), 1);
    EXPECT_EQ(crypto.sha256Calls.load(), 1);

    crypto.failDerive = true;
    securevault::core::rejectPassphrase(crypto, secureStringFrom("pw"), CommitmentScheme::Pbkdf2Sha256);
    EXPECT_EQ(crypto.deriveCalls.load(), 2);
}
