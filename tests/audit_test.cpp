/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file audit_test.cpp
 * @brief Small-scale runs of the collision audits.
 *
 * @details
 * The full-size audits take minutes and gigabytes; these runs keep the same
 * walk shape at a size suitable for every build.
 */

#include "lineage/core/audit.hpp"
#include "lineage/infra/logger.hpp"
#include "framework.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>

using lineage::core::Audit;
using lineage::core::AuditReport;
using lineage::core::Id;
using lineage::infra::Logger;
using lineage::infra::LogLevel;

namespace {

/**
 * @class StderrCapture
 * @brief RAII redirection of `std::cerr` and the logger threshold for one test.
 */
class StderrCapture {
  public:
    explicit StderrCapture(LogLevel level) : saved_level_(Logger::level())
    {
        saved_buf_ = std::cerr.rdbuf(buffer_.rdbuf());
        Logger::set_level(level);
    }

    ~StderrCapture()
    {
        std::cerr.rdbuf(saved_buf_);
        Logger::set_level(saved_level_);
    }

    std::string str() const { return buffer_.str(); }

  private:
    std::ostringstream buffer_;
    std::streambuf* saved_buf_ = nullptr;
    LogLevel saved_level_;
};

} // namespace

void test_audit_breadth_first_clean()
{
    AuditReport report = Audit::breadth_first(50000);
    ASSERT_FALSE(report.collided);
    ASSERT_EQ(report.generated, static_cast<uint64_t>(50000));
}

void test_audit_siblings_clean()
{
    AuditReport report = Audit::siblings(50000);
    ASSERT_FALSE(report.collided);
    ASSERT_EQ(report.generated, static_cast<uint64_t>(50000));
}

void test_audit_zero_count()
{
    AuditReport report = Audit::breadth_first(0);
    ASSERT_FALSE(report.collided);
    ASSERT_EQ(report.generated, static_cast<uint64_t>(0));
}

/**
 * @brief A repeated value fills every collision field and logs a warning.
 */
void test_audit_record_collision()
{
    Id root = Id::root();
    Id first = root.derive_child();
    // Different raw fields, same derived value.
    Id twin = Id::from_parts(first.local(), first.parent_value(), first.depth(), 99);

    std::unordered_set<Id> seen;
    AuditReport report;

    StderrCapture capture(LogLevel::WARN);
    ASSERT_TRUE(Audit::record(seen, first, 0, report));
    ASSERT_FALSE(report.collided);
    ASSERT_EQ(report.generated, static_cast<uint64_t>(1));

    ASSERT_TRUE(Audit::record(seen, root.derive_child(), 1, report));
    ASSERT_FALSE(Audit::record(seen, twin, 7, report));

    ASSERT_TRUE(report.collided);
    ASSERT_EQ(report.generated, static_cast<uint64_t>(8));
    ASSERT_EQ(report.collision_index, static_cast<uint64_t>(7));
    ASSERT_EQ(report.offender, first);
    ASSERT_EQ(report.offender.num_children(), static_cast<uint32_t>(99));

    const std::string log = capture.str();
    ASSERT_TRUE(log.find("[WARN] Audit: collision at 7 (value=0xd90ec8dfeeaa7228") !=
                std::string::npos);
    ASSERT_TRUE(log.find("depth=1)") != std::string::npos);
}
