/**
 * @file session_fixture.hpp
 * @brief gtest fixture owning a scratch Session and an Ingestor over it
 */

#pragma once

#include <gtest/gtest.h>
#include <ingestion/ingestor.hpp>
#include <session/session.hpp>
#include "fixtures/lmf_fixtures.hpp"
#include <memory>
#include <string>

namespace Lexicore::Fixtures {

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        session = std::make_unique<Session>(tmp.config());
        ingestor = std::make_unique<Ingestor>(*session);
    }

    void TearDown() override {
        ingestor.reset();
        session.reset();
    }

    /// Writes xml under the scratch dir and adds it.
    IngestionStats add_xml(const std::string& name, const std::string& xml, const AddOptions& options = {}) {
        return ingestor->add(tmp.write("input/" + name, xml), options);
    }

    TempDir tmp;
    std::unique_ptr<Session> session;
    std::unique_ptr<Ingestor> ingestor;
};

} // namespace Lexicore::Fixtures
