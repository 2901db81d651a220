// Copyright 2025 The XMBL Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "core/ledger.h"
#include "utility/common.h"
#include <sqlite3.h>
#include <array>
#include <stdexcept>

namespace xmbl {

class VaultDBUpgradeException : public std::runtime_error
{
public:
    VaultDBUpgradeException(const char* message)
        : std::runtime_error(message)
    {}
};

class VaultDB
{
public:

	struct ParamID {
		enum Enum {
			DbVer,
			UnitsIssued,
			NextShareID,
			ValueLocked,
			DepositsPaused,
			DistributionsPaused,
			CurveUnitScale, // fixed at creation
			CurveFeeBps,
		};
	};

	struct Query
	{
		enum Enum
		{
			Begin,
			Commit,
			Rollback,
			Scheme,
			ParamGet,
			ParamSet,
			ShareSave,
			ShareDel,
			ShareEnum,
			EventIns,
			EventLast,
			EventEnum,
			EventEnumKind,
			EventEnumAsc,
			EventCount,

			count
		};
	};

	typedef std::array<uint8_t, 32> Hash;

	struct EventRecord
	{
		uint64_t m_Seq = 0;
		Timestamp m_Time = 0;
		Event::Type::Enum m_Type = Event::Type::ShareIssued;
		ShareID m_ShareID = 0;
		OwnerID m_Owner;
		Amount m_Amount = 0;
		std::string m_Body;
		Hash m_Hash;

		// SHA-256 over the previous hash and all the record fields except seq and own hash
		void get_Hash(Hash&, const Hash& hvPrev) const;
	};

	VaultDB();
	~VaultDB();

	void Close();
	void Open(const char* szPath);

	bool IsOpen() const { return nullptr != m_pDb; }
	void CheckIntegrity();

	class Recordset
	{
		sqlite3_stmt* m_pStmt;
	public:

		VaultDB& m_DB;

		Recordset(VaultDB&, Query::Enum, const char*);
		~Recordset();

		void Reset();

		// Perform the query step. SELECT only: returns true while there're rows to read
		bool Step();
		void StepStrict(); // must return at least 1 row, applicable for SELECT

		// in/out
		void put(int col, uint32_t);
		void put(int col, uint64_t);
		void put(int col, int64_t);
		void put(int col, const char*);
		void put(int col, const std::string& s) { put(col, s.c_str()); }
		void put(int col, const Amount&); // as decimal text
		void put(int col, const Hash&);
		void get(int col, uint32_t&);
		void get(int col, uint64_t&);
		void get(int col, std::string&);
		void get(int col, Amount&);
		void get(int col, Hash&);

		bool IsNull(int col);
	};

	class Transaction {
		VaultDB* m_pDB;
	public:
		Transaction(VaultDB* = nullptr);
		Transaction(VaultDB& db) :Transaction(&db) {}
		~Transaction(); // by default - rolls back

		bool IsInProgress() const { return nullptr != m_pDB; }

		void Start(VaultDB&);
		void Commit();
		void Rollback();
	};

	// Hi-level functions

	void ParamIntSet(uint32_t ID, uint64_t val);
	uint64_t ParamIntGetDef(uint32_t ID, uint64_t def = 0);
	void ParamAmountSet(uint32_t ID, const Amount&);
	bool ParamAmountGet(uint32_t ID, Amount&);

	bool get_CurveParams(Curve::Params&);
	void set_CurveParams(const Curve::Params&);

	void SaveTotals(const Ledger::Totals&);
	void LoadTotals(Ledger::Totals&);

	void ShareSave(const Share&); // insert or replace
	void ShareDel(ShareID);
	void EnumShares(std::vector<Share>&); // ascending ids

	// Appends the event and links it to the previous one. Returns its seq
	uint64_t EventInsert(const Event::Any&, Timestamp);
	uint64_t get_EventCount();

	// newest first. nLimit == 0 means no limit
	void EnumEvents(std::vector<EventRecord>&, const Event::Type::Enum* pType = nullptr, uint32_t nLimit = 0);

	// Re-computes the whole chain. On failure nBadSeq is the first record that doesn't match
	bool VerifyEventChain(uint64_t& nBadSeq);

private:

	sqlite3* m_pDb;

	struct Statement
	{
		sqlite3_stmt* m_pStmt;
		Statement() :m_pStmt(nullptr) {}
		~Statement() { Close(); }

		void Close();
	};

	Statement m_pPrep[Query::count];

	void Prepare(Statement&, const char*);

	void TestRet(int);
	void ThrowSqliteError(int);
	static void ThrowError(const char*);

	void Create();
	void ExecQuick(const char*);
	std::string ExecTextOut(const char*);
	bool ExecStep(sqlite3_stmt*);
	bool ExecStep(Query::Enum, const char*); // returns true while there's a row

	sqlite3_stmt* get_Statement(Query::Enum, const char*);

	int get_RowsChanged() const;
	void TestChanged1Row();

	void get_LastEvent(uint64_t& nSeq, Hash&);
	static void ReadEvent(Recordset&, EventRecord&);
};

} // namespace xmbl
