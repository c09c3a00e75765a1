/**
 * @file test_transport_policy.cpp
 * @brief Unit tests for file analysis and transport selection
 */

#include <gtest/gtest.h>

#include <kcenon/fastdrop/core/checksum.h>
#include <kcenon/fastdrop/core/transport_policy.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace kcenon::fastdrop::test {

class TransportPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "fastdrop_test_policy";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size) -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        std::string data(size, 'x');
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        return path;
    }

    static constexpr uint64_t mb = 1024 * 1024;
    std::filesystem::path test_dir_;
};

// select_transport

TEST_F(TransportPolicyTest, Select_ManySmallFilesUseQuic) {
    EXPECT_EQ(select_transport(6, 1024), transport_kind::quic);
}

TEST_F(TransportPolicyTest, Select_FewLargeFilesUseTcp) {
    EXPECT_EQ(select_transport(2, 200 * mb), transport_kind::tcp);
}

TEST_F(TransportPolicyTest, Select_FewSmallFilesUseQuic) {
    EXPECT_EQ(select_transport(2, 50 * mb), transport_kind::quic);
}

TEST_F(TransportPolicyTest, Select_Boundaries) {
    // Exactly five files and exactly 100MB fall to tcp
    EXPECT_EQ(select_transport(5, 100 * mb), transport_kind::tcp);
    EXPECT_EQ(select_transport(5, 100 * mb - 1), transport_kind::quic);
    EXPECT_EQ(select_transport(6, 100 * mb), transport_kind::quic);
    EXPECT_EQ(select_transport(6, 400 * mb), transport_kind::quic);
}

TEST_F(TransportPolicyTest, Select_IsDeterministic) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(select_transport(3, 150 * mb), transport_kind::tcp);
        EXPECT_EQ(select_transport(3, 15 * mb), transport_kind::quic);
    }
}

// analyze_files

TEST_F(TransportPolicyTest, Analyze_BuildsManifestInInputOrder) {
    auto a = create_test_file("b_second.txt", 300);
    auto b = create_test_file("a_first.txt", 100);

    auto plan = analyze_files({a, b});
    ASSERT_TRUE(plan.has_value()) << plan.error().message;

    const auto& manifest = plan.value().manifest;
    ASSERT_EQ(manifest.size(), 2u);
    EXPECT_EQ(manifest.files[0].name, "b_second.txt");
    EXPECT_EQ(manifest.files[0].size, 300u);
    EXPECT_EQ(manifest.files[1].name, "a_first.txt");
    EXPECT_EQ(manifest.total_size, 400u);
    EXPECT_EQ(plan.value().paths, (std::vector<std::filesystem::path>{a, b}));
    EXPECT_EQ(plan.value().transport, transport_kind::quic);

    ASSERT_TRUE(manifest.files[0].content_hash.has_value());
    auto digest = checksum::sha256_file(a);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*manifest.files[0].content_hash, digest.value());
}

TEST_F(TransportPolicyTest, Analyze_ZeroByteFileIsAccepted) {
    auto empty = create_test_file("empty.bin", 0);
    auto plan = analyze_files({empty});
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().manifest.files[0].size, 0u);
}

TEST_F(TransportPolicyTest, Analyze_IsIdempotent) {
    auto a = create_test_file("a.bin", 1000);
    auto first = analyze_files({a});
    auto second = analyze_files({a});
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value().manifest, second.value().manifest);
    EXPECT_EQ(first.value().transport, second.value().transport);
}

TEST_F(TransportPolicyTest, Analyze_EmptyInput) {
    auto plan = analyze_files({});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::no_input_files);
}

TEST_F(TransportPolicyTest, Analyze_MissingPath) {
    auto a = create_test_file("a.bin", 10);
    auto plan = analyze_files({a, test_dir_ / "missing.bin"});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::file_not_found);
}

TEST_F(TransportPolicyTest, Analyze_Directory) {
    auto plan = analyze_files({test_dir_});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::not_regular_file);
}

TEST_F(TransportPolicyTest, Analyze_PerFileCap) {
    auto a = create_test_file("a.bin", 2048);
    auto plan = analyze_files({a}, size_limits{2047, 1 * mb});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::file_too_large);

    auto at_limit = analyze_files({a}, size_limits{2048, 1 * mb});
    EXPECT_TRUE(at_limit.has_value());
}

TEST_F(TransportPolicyTest, Analyze_AggregateCap) {
    auto a = create_test_file("a.bin", 600);
    auto b = create_test_file("b.bin", 600);
    auto plan = analyze_files({a, b}, size_limits{1000, 1000});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::aggregate_too_large);
}

TEST_F(TransportPolicyTest, DefaultLimits) {
    size_limits limits;
    EXPECT_EQ(limits.max_file_size, 100 * mb);
    EXPECT_EQ(limits.max_total_size, 500 * mb);
}

}  // namespace kcenon::fastdrop::test
