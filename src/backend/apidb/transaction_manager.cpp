/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#include "authgate/backend/apidb/transaction_manager.hpp"

#include <pqxx/pqxx>


Transaction_Owner_ReadWrite::Transaction_Owner_ReadWrite(pqxx::connection &conn,
    std::set< std::string > &prep_stmt) :
    m_txn { conn }, m_prep_stmt { prep_stmt }
{
}

pqxx::transaction_base& Transaction_Owner_ReadWrite::get_transaction()
{
  return m_txn;
}

std::set<std::string>& Transaction_Owner_ReadWrite::get_prep_stmt()
{
  return m_prep_stmt;
}

Transaction_Manager::Transaction_Manager(Transaction_Owner_Base &to) :
    m_txn { to.get_transaction() }, m_prep_stmt(to.get_prep_stmt())
{
}

void Transaction_Manager::prepare(const std::string &name,
                                  const std::string &definition) {
  if (!m_prep_stmt.contains(name))
  {
    m_txn.conn().prepare(name, definition);
    m_prep_stmt.insert(name);
  }
}

void Transaction_Manager::commit() {
  const auto start = std::chrono::steady_clock::now();
  m_txn.commit();
  const auto end = std::chrono::steady_clock::now();

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  logger::message("DB", fmt::format("COMMIT transaction in {:d} ms", elapsed.count()));
}
