#include "chatrelay/account_pool.hpp"
#include "chatrelay/session.hpp"
#include "fake_http_client.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>

using namespace chatrelay;
using chatrelay::test::TempAccountsFile;

class AccountPoolTest : public ::testing::Test {
protected:
    void load(int count) {
        file_ = std::make_unique<TempAccountsFile>(test::accounts_document(count));
        store_ = std::make_unique<CredentialStore>(file_->path());
        pool_ = std::make_unique<AccountPool>(*store_);
        ASSERT_EQ(pool_->load(), static_cast<std::size_t>(count));
    }

    void make_unhealthy(Account& account) {
        for (int i = 0; i < UNHEALTHY_ERROR_THRESHOLD; i++) {
            pool_->release(account, "boom");
        }
    }

    std::unique_ptr<TempAccountsFile> file_;
    std::unique_ptr<CredentialStore> store_;
    std::unique_ptr<AccountPool> pool_;
};

TEST_F(AccountPoolTest, SequentialAcquiresReturnDistinctAccounts) {
    load(4);

    std::set<std::string> seen;
    for (int i = 0; i < 4; i++) {
        Account* account = pool_->acquire();
        ASSERT_NE(account, nullptr);
        EXPECT_TRUE(account->leased);
        seen.insert(account->identity);
    }

    EXPECT_EQ(seen.size(), 4u);
}

TEST_F(AccountPoolTest, RoundRobinContinuesAfterRelease) {
    load(3);

    Account* first = pool_->acquire();
    pool_->release(*first);
    Account* second = pool_->acquire();
    pool_->release(*second);

    EXPECT_EQ(first->identity, "user0@example.com");
    EXPECT_EQ(second->identity, "user1@example.com");
}

TEST_F(AccountPoolTest, SkipsUnhealthyAccounts) {
    load(2);

    Account* bad = pool_->acquire();
    make_unhealthy(*bad);

    for (int i = 0; i < 3; i++) {
        Account* account = pool_->acquire();
        ASSERT_NE(account, nullptr);
        EXPECT_NE(account, bad);
        pool_->release(*account);
    }
}

TEST_F(AccountPoolTest, ForcedFallbackWhenAllUnhealthy) {
    load(3);

    for (int i = 0; i < 3; i++) {
        make_unhealthy(*pool_->acquire());
    }

    Account* account = pool_->acquire();
    ASSERT_NE(account, nullptr);
    EXPECT_TRUE(account->leased);
    EXPECT_EQ(account->error_count, UNHEALTHY_ERROR_THRESHOLD);
}

TEST_F(AccountPoolTest, ForcedFallbackWhenAllLeased) {
    load(2);

    Account* a = pool_->acquire();
    Account* b = pool_->acquire();
    Account* c = pool_->acquire();

    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c == a || c == b);
}

TEST_F(AccountPoolTest, FiveErrorsThenCleanReleaseRestoresEligibility) {
    load(1);

    Account* account = pool_->acquire();
    for (int i = 0; i < 5; i++) {
        pool_->release(*account, "error " + std::to_string(i));
    }
    EXPECT_EQ(account->error_count, UNHEALTHY_ERROR_THRESHOLD);
    EXPECT_EQ(account->last_error, "error 4");
    EXPECT_EQ(pool_->status().available, 0u);

    pool_->release(*account);

    EXPECT_EQ(account->error_count, 0);
    EXPECT_EQ(pool_->status().available, 1u);
}

TEST_F(AccountPoolTest, ReleaseTruncatesDiagnostic) {
    load(1);

    Account* account = pool_->acquire();
    pool_->release(*account, std::string(500, 'e'));

    EXPECT_EQ(account->last_error.size(), ERROR_BODY_LIMIT);
}

TEST_F(AccountPoolTest, EmptyPoolReturnsNull) {
    load(0);

    EXPECT_EQ(pool_->acquire(), nullptr);
}

TEST_F(AccountPoolTest, StatusReportsAccounts) {
    load(2);

    Account* account = pool_->acquire();
    pool_->release(*account, "Stream [503]");
    pool_->acquire();

    json status = pool_->status().to_json();

    EXPECT_EQ(status["total"], 2);
    EXPECT_EQ(status["available"], 2);
    ASSERT_EQ(status["accounts"].size(), 2u);
    EXPECT_EQ(status["accounts"][0]["identity"], "user0@example.com");
    EXPECT_EQ(status["accounts"][0]["errors"], 1);
    EXPECT_EQ(status["accounts"][0]["last_error"], "Stream [503]");
    EXPECT_EQ(status["accounts"][0]["has_token"], false);
    EXPECT_EQ(status["accounts"][1]["leased"], true);
}

TEST_F(AccountPoolTest, ConcurrentLeasesAreAllReturned) {
    load(4);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([this] {
            for (int i = 0; i < 500; i++) {
                Account* account = pool_->acquire();
                ASSERT_NE(account, nullptr);
                pool_->release(*account);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& account : pool_->status().accounts) {
        EXPECT_FALSE(account.leased);
        EXPECT_EQ(account.errors, 0);
    }
}

TEST_F(AccountPoolTest, RefreshLocksAreDistinctPerAccount) {
    load(2);

    Account* a = pool_->acquire();
    Account* b = pool_->acquire();

    EXPECT_NE(&pool_->refresh_lock(*a), &pool_->refresh_lock(*b));
    EXPECT_EQ(&pool_->refresh_lock(*a), &pool_->refresh_lock(*a));
}

TEST_F(AccountPoolTest, LeaseReleasesExactlyOnce) {
    load(1);

    Account* account = pool_->acquire();
    {
        Lease lease(*pool_, *account);
        EXPECT_TRUE(lease.release("first failure"));
        EXPECT_FALSE(lease.release("second failure"));
        EXPECT_FALSE(lease.release());
        EXPECT_TRUE(lease.released());
    }

    EXPECT_FALSE(account->leased);
    EXPECT_EQ(account->error_count, 1);
    EXPECT_EQ(account->last_error, "first failure");
}

TEST_F(AccountPoolTest, LeaseDestructorReleasesClean) {
    load(1);

    Account* account = pool_->acquire();
    pool_->release(*account, "earlier failure");
    account = pool_->acquire();
    {
        Lease lease(*pool_, *account);
        EXPECT_TRUE(account->leased);
    }

    EXPECT_FALSE(account->leased);
    EXPECT_EQ(account->error_count, 0);
}
