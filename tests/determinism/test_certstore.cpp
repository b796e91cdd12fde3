/**
 * @file test_certstore.cpp
 * @brief Certificate persistence, content hashing and file exchange
 */

#include "axiom/certstore.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using axiom::certificate::ProofCertificate;
using axiom::certificate::ProofType;
using axiom::certstore::CertStore;

namespace {

const axiom::WallClock::time_point kNow{std::chrono::seconds{1704067200}};

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

/// Certificate rows kept in memory so tests can corrupt them
class FakeCertificates : public axiom::store::CertificateRepository
{
public:
    std::map<std::string, axiom::store::CertificateRow> rows;

    axiom::VoidResult insert_certificate(const axiom::store::CertificateRow& row) override
    {
        if (!rows.emplace(row.id, row).second) {
            return std::unexpected(axiom::Error::make(axiom::errc::kConflict, "duplicate id"));
        }
        return {};
    }

    axiom::Result<axiom::store::CertificateRow> find_certificate(const std::string& id) override
    {
        auto it = rows.find(id);
        if (it == rows.end()) {
            return std::unexpected(axiom::Error::make(axiom::errc::kNotFound, "certificate not found: " + id));
        }
        return it->second;
    }

    axiom::Result<std::optional<axiom::store::CertificateRow>> find_certificate_for(
        const std::string& ivcu_id,
        const std::string& proof_type) override
    {
        for (const auto& [id, row] : rows) {
            if (row.ivcu_id == ivcu_id && row.proof_type == proof_type) {
                return std::optional<axiom::store::CertificateRow>{row};
            }
        }
        return std::optional<axiom::store::CertificateRow>{};
    }
};

ProofCertificate make_certificate(const std::string& ivcu_id, ProofType type = ProofType::kTypeSafety)
{
    axiom::certificate::CertificateService service("signing-key", "1.0.0", [] { return kNow; });
    const axiom::ivcu::IvcuRecord unit{.id = ivcu_id,
                                       .project_id = "p1",
                                       .version = 1,
                                       .status = axiom::ivcu::Status::kVerified,
                                       .confidence_score = 0.95,
                                       .parent_ids = {}};
    const std::vector<axiom::ivcu::VerifierResult> results = {
        {.name = "syntax", .tier = 1, .passed = true, .confidence = 1.0},
        {.name = "types", .tier = 2, .passed = true, .confidence = 0.9}};
    auto cert = service.generate_certificate(unit, "intent-1", "let x = 1;\n", type, results);
    EXPECT_TRUE(cert) << cert.error().message;
    return cert.value_or(ProofCertificate{});
}

}  // namespace

class SqliteCertStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto opened = axiom::store::SqliteStore::open(":memory:");
        ASSERT_TRUE(opened) << opened.error().message;
        m_store = std::move(*opened);
        ASSERT_TRUE(m_store->migrate());
        ASSERT_TRUE(m_store->add_project(axiom::store::ProjectRecord{.id = "p1", .name = "P", .owner_id = "alice"}));
        for (const char* id : {"ivcu-1", "ivcu-2"}) {
            ASSERT_TRUE(m_store->save_ivcu(axiom::ivcu::IvcuRecord{.id = id,
                                                                   .project_id = "p1",
                                                                   .version = 1,
                                                                   .status = axiom::ivcu::Status::kVerified,
                                                                   .confidence_score = 0.95,
                                                                   .parent_ids = {}}));
        }
        m_certs = std::make_unique<CertStore>(*m_store, AXIOM_SCHEMA_DIR);
    }

    std::unique_ptr<axiom::store::SqliteStore> m_store;
    std::unique_ptr<CertStore> m_certs;
};

TEST_F(SqliteCertStoreTest, PutThenGet)
{
    const ProofCertificate cert = make_certificate("ivcu-1");
    auto hash = m_certs->put(cert);
    ASSERT_TRUE(hash) << hash.error().message;
    EXPECT_TRUE(hash->starts_with("sha256:"));

    auto loaded = m_certs->get(cert.id);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(axiom::certificate::to_json(*loaded), axiom::certificate::to_json(cert));
}

TEST_F(SqliteCertStoreTest, ContentHashIsDeterministic)
{
    const ProofCertificate cert = make_certificate("ivcu-1");
    auto first = m_certs->put(cert);
    ASSERT_TRUE(first);

    FakeCertificates other_repo;
    CertStore other(other_repo, AXIOM_SCHEMA_DIR);
    auto second = other.put(cert);
    ASSERT_TRUE(second);
    EXPECT_EQ(*first, *second);
}

TEST_F(SqliteCertStoreTest, OneCertificatePerUnitAndProofType)
{
    ASSERT_TRUE(m_certs->put(make_certificate("ivcu-1")));

    auto duplicate = m_certs->put(make_certificate("ivcu-1"));
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, axiom::errc::kConflict);

    EXPECT_TRUE(m_certs->put(make_certificate("ivcu-1", ProofType::kMemorySafety)));
    EXPECT_TRUE(m_certs->put(make_certificate("ivcu-2")));
}

TEST_F(SqliteCertStoreTest, FindFor)
{
    const ProofCertificate cert = make_certificate("ivcu-1", ProofType::kPropertyBased);
    ASSERT_TRUE(m_certs->put(cert));

    auto found = m_certs->find_for("ivcu-1", ProofType::kPropertyBased);
    ASSERT_TRUE(found);
    ASSERT_TRUE(found->has_value());
    EXPECT_EQ((*found)->id, cert.id);

    auto absent = m_certs->find_for("ivcu-1", ProofType::kTypeSafety);
    ASSERT_TRUE(absent);
    EXPECT_FALSE(absent->has_value());
}

TEST_F(SqliteCertStoreTest, UnknownIdIsNotFound)
{
    auto loaded = m_certs->get("no-such-certificate");
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, axiom::errc::kNotFound);
}

TEST(CertStore, DetectsCorruptedDocument)
{
    FakeCertificates repo;
    CertStore certs(repo, AXIOM_SCHEMA_DIR);
    const ProofCertificate cert = make_certificate("ivcu-1");
    ASSERT_TRUE(certs.put(cert));

    auto& row = repo.rows.at(cert.id);
    const auto pos = row.document.find("intent-1");
    ASSERT_NE(pos, std::string::npos);
    row.document.replace(pos, 8, "intent-9");

    auto loaded = certs.get(cert.id);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, axiom::errc::kIntegrityViolation);
}

TEST(CertStore, DetectsUnparseableDocument)
{
    FakeCertificates repo;
    CertStore certs(repo, AXIOM_SCHEMA_DIR);
    const ProofCertificate cert = make_certificate("ivcu-1");
    ASSERT_TRUE(certs.put(cert));
    repo.rows.at(cert.id).document = "{ truncated";

    auto loaded = certs.get(cert.id);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, axiom::errc::kIntegrityViolation);
}

TEST(CertStore, RejectsSchemaViolation)
{
    FakeCertificates repo;
    CertStore certs(repo, AXIOM_SCHEMA_DIR);
    ProofCertificate cert = make_certificate("ivcu-1");
    cert.code_hash = "not-a-digest";

    auto hash = certs.put(cert);
    ASSERT_FALSE(hash);
    EXPECT_TRUE(repo.rows.empty());
}

TEST(CertStore, ExportImportFile)
{
    TempDir temp_dir("axiom_certstore_test");
    FakeCertificates repo;
    CertStore certs(repo, AXIOM_SCHEMA_DIR);
    const ProofCertificate cert = make_certificate("ivcu-1");

    const auto path = (temp_dir.path() / "nested" / "cert.json").string();
    ASSERT_TRUE(certs.export_file(cert, path));
    ASSERT_TRUE(std::filesystem::exists(path));

    auto imported = certs.import_file(path);
    ASSERT_TRUE(imported) << imported.error().message;
    EXPECT_EQ(axiom::certificate::to_json(*imported), axiom::certificate::to_json(cert));

    // Exported bytes are canonical: exporting the import gives the same file
    const auto again = (temp_dir.path() / "again.json").string();
    ASSERT_TRUE(certs.export_file(*imported, again));
    std::ifstream a(path, std::ios::binary);
    std::ifstream b(again, std::ios::binary);
    const std::string first{std::istreambuf_iterator<char>{a}, std::istreambuf_iterator<char>{}};
    const std::string second{std::istreambuf_iterator<char>{b}, std::istreambuf_iterator<char>{}};
    EXPECT_EQ(first, second);
}

TEST(CertStore, ImportRejectsBadFiles)
{
    TempDir temp_dir("axiom_certstore_import_test");
    FakeCertificates repo;
    CertStore certs(repo, AXIOM_SCHEMA_DIR);

    auto missing = certs.import_file((temp_dir.path() / "absent.json").string());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, axiom::errc::kIO);

    const auto garbage = (temp_dir.path() / "garbage.json").string();
    std::ofstream(garbage) << "not json";
    auto parsed = certs.import_file(garbage);
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, axiom::errc::kParse);

    const auto partial = (temp_dir.path() / "partial.json").string();
    std::ofstream(partial) << R"({"schema_version": "proof_certificate.v1", "id": "c1"})";
    EXPECT_FALSE(certs.import_file(partial));
}
