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

#include "db.h"
#include "utility/logger.h"
#include <openssl/evp.h>
#include <memory>

namespace xmbl {

// Literal constants
#define TblParams				"Params"
#define TblParams_ID			"ID"
#define TblParams_Int			"ParamInt"
#define TblParams_Text			"ParamText"

#define TblShares				"Shares"
#define TblShares_ID			"ID"
#define TblShares_Owner			"Owner"
#define TblShares_Deposit		"DepositValue"
#define TblShares_Yield			"AccruedYield"
#define TblShares_Kind			"Kind"
#define TblShares_Remaining		"MetaRemaining"
#define TblShares_NextPos		"MetaNextPos"
#define TblShares_Reserved		"MetaReserved"

#define TblEvents				"Events"
#define TblEvents_Seq			"Seq"
#define TblEvents_Time			"Time"
#define TblEvents_Kind			"Kind"
#define TblEvents_ShareID		"ShareID"
#define TblEvents_Owner			"Owner"
#define TblEvents_Amount		"Amount"
#define TblEvents_Body			"Body"
#define TblEvents_Hash			"Hash"

#define TblEvents_All TblEvents_Seq "," TblEvents_Time "," TblEvents_Kind "," TblEvents_ShareID "," TblEvents_Owner "," TblEvents_Amount "," TblEvents_Body "," TblEvents_Hash

VaultDB::VaultDB()
	:m_pDb(nullptr)
{
}

VaultDB::~VaultDB()
{
	Close();
}

void VaultDB::TestRet(int ret)
{
	if (SQLITE_OK != ret)
		ThrowSqliteError(ret);
}

void VaultDB::ThrowSqliteError(int ret)
{
	char sz[0x1000];
	snprintf(sz, _countof(sz), "sqlite err %d, %s", ret, sqlite3_errmsg(m_pDb));
	ThrowError(sz);
}

void VaultDB::ThrowError(const char* sz)
{
	// Currently all DB errors are defined as corruption
	CorruptionException::Throw(sz);
}

void VaultDB::Statement::Close()
{
	if (m_pStmt)
	{
		sqlite3_finalize(m_pStmt); // don't care about retval
		m_pStmt = nullptr;
	}
}

void VaultDB::Close()
{
	if (m_pDb)
	{
		for (size_t i = 0; i < _countof(m_pPrep); i++)
			m_pPrep[i].Close();

		XMBL_VERIFY(SQLITE_OK == sqlite3_close(m_pDb));
		m_pDb = nullptr;
	}
}

VaultDB::Recordset::Recordset(VaultDB& db, Query::Enum val, const char* sql)
	:m_DB(db)
{
	m_pStmt = db.get_Statement(val, sql);
}

VaultDB::Recordset::~Recordset()
{
	Reset();
}

void VaultDB::Recordset::Reset()
{
	if (m_pStmt)
	{
		sqlite3_reset(m_pStmt); // don't care about retval
		sqlite3_clear_bindings(m_pStmt);
	}
}

bool VaultDB::Recordset::Step()
{
	return m_DB.ExecStep(m_pStmt);
}

void VaultDB::Recordset::StepStrict()
{
	if (!Step())
		ThrowError("not found");
}

bool VaultDB::Recordset::IsNull(int col)
{
	return SQLITE_NULL == sqlite3_column_type(m_pStmt, col);
}

void VaultDB::Recordset::put(int col, uint32_t x)
{
	m_DB.TestRet(sqlite3_bind_int(m_pStmt, col+1, x));
}

void VaultDB::Recordset::put(int col, uint64_t x)
{
	m_DB.TestRet(sqlite3_bind_int64(m_pStmt, col+1, x));
}

void VaultDB::Recordset::put(int col, int64_t x)
{
	m_DB.TestRet(sqlite3_bind_int64(m_pStmt, col+1, x));
}

void VaultDB::Recordset::put(int col, const char* sz)
{
	m_DB.TestRet(sqlite3_bind_text(m_pStmt, col+1, sz, -1, SQLITE_TRANSIENT));
}

void VaultDB::Recordset::put(int col, const Amount& x)
{
	put(col, AmountToString(x));
}

void VaultDB::Recordset::put(int col, const Hash& x)
{
	m_DB.TestRet(sqlite3_bind_blob(m_pStmt, col+1, x.data(), static_cast<int>(x.size()), SQLITE_TRANSIENT));
}

void VaultDB::Recordset::get(int col, uint32_t& x)
{
	x = sqlite3_column_int(m_pStmt, col);
}

void VaultDB::Recordset::get(int col, uint64_t& x)
{
	x = sqlite3_column_int64(m_pStmt, col);
}

void VaultDB::Recordset::get(int col, std::string& s)
{
	const unsigned char* sz = sqlite3_column_text(m_pStmt, col);
	if (sz)
		s.assign(reinterpret_cast<const char*>(sz), sqlite3_column_bytes(m_pStmt, col));
	else
		s.clear();
}

void VaultDB::Recordset::get(int col, Amount& x)
{
	std::string s;
	get(col, s);

	if (!AmountFromString(x, s))
		ThrowError(("bad amount: " + s).c_str());
}

void VaultDB::Recordset::get(int col, Hash& x)
{
	int n = sqlite3_column_bytes(m_pStmt, col);
	if (static_cast<size_t>(n) != x.size())
	{
		char sz[0x80];
		snprintf(sz, sizeof(sz), "Hash size expected=%u, actual=%d", static_cast<uint32_t>(x.size()), n);
		ThrowError(sz);
	}

	memcpy(x.data(), sqlite3_column_blob(m_pStmt, col), x.size());
}

void VaultDB::Open(const char* szPath)
{
	TestRet(sqlite3_open_v2(szPath, &m_pDb, SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX | SQLITE_OPEN_CREATE, NULL));
	sqlite3_busy_timeout(m_pDb, 5000);

	ExecTextOut("PRAGMA journal_size_limit=1048576");

	bool bCreate;
	{
		Recordset rs(*this, Query::Scheme, "SELECT name FROM sqlite_master WHERE type='table' AND name=?");
		rs.put(0, TblParams);
		bCreate = !rs.Step();
	}

	const uint64_t nVersionTop = 1;

	Transaction t(*this);

	if (bCreate)
	{
		LOG_INFO() << "Creating ledger db " << szPath;
		Create();
		ParamIntSet(ParamID::DbVer, nVersionTop);
	}
	else
	{
		uint64_t nVer = ParamIntGetDef(ParamID::DbVer);
		switch (nVer)
		{
		case nVersionTop:
			break;

		default:
			if (nVer > nVersionTop)
				throw VaultDBUpgradeException("Unsupported db version");

			throw VaultDBUpgradeException("Ledger db upgrade is not supported");
		}
	}

	t.Commit();
}

void VaultDB::CheckIntegrity()
{
	std::string s = ExecTextOut("PRAGMA integrity_check");
	if (s != "ok")
		ThrowError(("sqlite integrity: " + s).c_str());
}

void VaultDB::Create()
{
	ExecQuick("CREATE TABLE [" TblParams "] ("
		"[" TblParams_ID	"] INTEGER NOT NULL PRIMARY KEY,"
		"[" TblParams_Int	"] INTEGER,"
		"[" TblParams_Text	"] TEXT)");

	ExecQuick("CREATE TABLE [" TblShares "] ("
		"[" TblShares_ID		"] INTEGER NOT NULL PRIMARY KEY,"
		"[" TblShares_Owner		"] TEXT NOT NULL,"
		"[" TblShares_Deposit	"] TEXT NOT NULL,"
		"[" TblShares_Yield		"] TEXT NOT NULL,"
		"[" TblShares_Kind		"] INTEGER NOT NULL,"
		"[" TblShares_Remaining	"] INTEGER NOT NULL,"
		"[" TblShares_NextPos	"] INTEGER NOT NULL,"
		"[" TblShares_Reserved	"] INTEGER NOT NULL)");

	ExecQuick("CREATE INDEX [Idx" TblShares "Own] ON [" TblShares "] ([" TblShares_Owner "],[" TblShares_ID "]);");

	ExecQuick("CREATE TABLE [" TblEvents "] ("
		"[" TblEvents_Seq		"] INTEGER NOT NULL PRIMARY KEY,"
		"[" TblEvents_Time		"] INTEGER NOT NULL,"
		"[" TblEvents_Kind		"] INTEGER NOT NULL,"
		"[" TblEvents_ShareID	"] INTEGER NOT NULL,"
		"[" TblEvents_Owner		"] TEXT NOT NULL,"
		"[" TblEvents_Amount	"] TEXT NOT NULL,"
		"[" TblEvents_Body		"] TEXT NOT NULL,"
		"[" TblEvents_Hash		"] BLOB NOT NULL)");

	ExecQuick("CREATE INDEX [Idx" TblEvents "Kind] ON [" TblEvents "] ([" TblEvents_Kind "],[" TblEvents_Seq "]);");
}

void VaultDB::ExecQuick(const char* szSql)
{
	TestRet(sqlite3_exec(m_pDb, szSql, NULL, NULL, NULL));
}

std::string VaultDB::ExecTextOut(const char* szSql)
{
	Statement s;
	Prepare(s, szSql);

	std::string sRes;

	if (ExecStep(s.m_pStmt))
	{
		const unsigned char* sz = sqlite3_column_text(s.m_pStmt, 0);
		if (sz)
			sRes = reinterpret_cast<const char*>(sz);
	}

	return sRes;
}

bool VaultDB::ExecStep(sqlite3_stmt* pStmt)
{
	int nVal = sqlite3_step(pStmt);
	switch (nVal)
	{

	default:
		ThrowSqliteError(nVal);
		// no break

	case SQLITE_DONE:
		return false;

	case SQLITE_ROW:
		return true;
	}
}

bool VaultDB::ExecStep(Query::Enum val, const char* sql)
{
	sqlite3_stmt* pStmt = get_Statement(val, sql);
	bool bRes = ExecStep(pStmt);
	sqlite3_reset(pStmt);
	return bRes;
}

void VaultDB::Prepare(Statement& s, const char* szSql)
{
	assert(!s.m_pStmt);

	const char* szTail;
	int nRet = sqlite3_prepare_v2(m_pDb, szSql, -1, &s.m_pStmt, &szTail);
	TestRet(nRet);
	assert(s.m_pStmt);
}

sqlite3_stmt* VaultDB::get_Statement(Query::Enum val, const char* sql)
{
	assert(val < _countof(m_pPrep));
	Statement& s = m_pPrep[val];

	if (!s.m_pStmt)
		Prepare(s, sql);
	return s.m_pStmt;
}

int VaultDB::get_RowsChanged() const
{
	return sqlite3_changes(m_pDb);
}

void VaultDB::TestChanged1Row()
{
	if (1 != get_RowsChanged())
		ThrowError("1row change failed");
}

VaultDB::Transaction::Transaction(VaultDB* pDB)
	:m_pDB(nullptr)
{
	if (pDB)
		Start(*pDB);
}

VaultDB::Transaction::~Transaction()
{
	if (std::uncaught_exceptions())
	{
		// already unwinding, a second exception would terminate
		try {
			Rollback();
		}
		catch (const CorruptionException& e) {
			LOG_ERROR() << "Rollback failed: " << e.m_sErr;
		}
	}
	else
		Rollback();
}

void VaultDB::Transaction::Start(VaultDB& db)
{
	assert(!m_pDB);
	db.ExecStep(Query::Begin, "BEGIN");
	m_pDB = &db;
}

void VaultDB::Transaction::Commit()
{
	assert(m_pDB);
	m_pDB->ExecStep(Query::Commit, "COMMIT");
	m_pDB = nullptr;
}

void VaultDB::Transaction::Rollback()
{
	if (m_pDB)
	{
		VaultDB* pDB = m_pDB;
		m_pDB = nullptr;
		pDB->ExecStep(Query::Rollback, "ROLLBACK");
	}
}

void VaultDB::ParamIntSet(uint32_t ID, uint64_t val)
{
	Recordset rs(*this, Query::ParamSet, "INSERT OR REPLACE INTO " TblParams " (" TblParams_ID "," TblParams_Int "," TblParams_Text ") VALUES(?,?,?)");
	rs.put(0, ID);
	rs.put(1, val);
	rs.Step();
}

uint64_t VaultDB::ParamIntGetDef(uint32_t ID, uint64_t def /* = 0 */)
{
	Recordset rs(*this, Query::ParamGet, "SELECT " TblParams_Int "," TblParams_Text " FROM " TblParams " WHERE " TblParams_ID "=?");
	rs.put(0, ID);

	if (rs.Step() && !rs.IsNull(0))
		rs.get(0, def);

	return def;
}

void VaultDB::ParamAmountSet(uint32_t ID, const Amount& x)
{
	Recordset rs(*this, Query::ParamSet, "INSERT OR REPLACE INTO " TblParams " (" TblParams_ID "," TblParams_Int "," TblParams_Text ") VALUES(?,?,?)");
	rs.put(0, ID);
	rs.put(2, x);
	rs.Step();
}

bool VaultDB::ParamAmountGet(uint32_t ID, Amount& x)
{
	Recordset rs(*this, Query::ParamGet, "SELECT " TblParams_Int "," TblParams_Text " FROM " TblParams " WHERE " TblParams_ID "=?");
	rs.put(0, ID);

	if (!rs.Step() || rs.IsNull(1))
		return false;

	rs.get(1, x);
	return true;
}

bool VaultDB::get_CurveParams(Curve::Params& pars)
{
	Amount scale;
	if (!ParamAmountGet(ParamID::CurveUnitScale, scale))
		return false;

	pars.m_UnitScale = scale;
	pars.m_FeeBps = static_cast<uint32_t>(ParamIntGetDef(ParamID::CurveFeeBps));

	if (!pars.IsValid())
		ThrowError("stored curve params invalid");

	return true;
}

void VaultDB::set_CurveParams(const Curve::Params& pars)
{
	ParamAmountSet(ParamID::CurveUnitScale, pars.m_UnitScale);
	ParamIntSet(ParamID::CurveFeeBps, pars.m_FeeBps);
}

void VaultDB::SaveTotals(const Ledger::Totals& t)
{
	ParamIntSet(ParamID::UnitsIssued, t.m_UnitsIssued);
	ParamIntSet(ParamID::NextShareID, t.m_NextShareID);
	ParamAmountSet(ParamID::ValueLocked, t.m_ValueLocked);
	ParamIntSet(ParamID::DepositsPaused, t.m_DepositsPaused ? 1 : 0);
	ParamIntSet(ParamID::DistributionsPaused, t.m_DistributionsPaused ? 1 : 0);
}

void VaultDB::LoadTotals(Ledger::Totals& t)
{
	t = Ledger::Totals();
	t.m_UnitsIssued = ParamIntGetDef(ParamID::UnitsIssued);
	t.m_NextShareID = ParamIntGetDef(ParamID::NextShareID, t.m_NextShareID);
	ParamAmountGet(ParamID::ValueLocked, t.m_ValueLocked);
	t.m_DepositsPaused = !!ParamIntGetDef(ParamID::DepositsPaused);
	t.m_DistributionsPaused = !!ParamIntGetDef(ParamID::DistributionsPaused);
}

void VaultDB::ShareSave(const Share& s)
{
	Recordset rs(*this, Query::ShareSave, "INSERT OR REPLACE INTO " TblShares " (" TblShares_ID "," TblShares_Owner "," TblShares_Deposit "," TblShares_Yield ","
		TblShares_Kind "," TblShares_Remaining "," TblShares_NextPos "," TblShares_Reserved ") VALUES(?,?,?,?,?,?,?,?)");

	uint64_t nRemaining = 0, nNextPos = 0, nReserved = 0;

	const Share::Meta* pMeta = s.get_Meta();
	if (pMeta)
	{
		nRemaining = pMeta->m_Remaining;
		nNextPos = pMeta->m_NextPosition;
		nReserved = pMeta->m_Reserved;
	}
	else
	{
		const Share::ClosedMeta* pClosed = std::get_if<Share::ClosedMeta>(&s.m_State);
		if (pClosed)
			nReserved = pClosed->m_Reserved;
	}

	rs.put(0, s.m_ID);
	rs.put(1, s.m_Owner);
	rs.put(2, s.m_DepositValue);
	rs.put(3, s.m_AccruedYield);
	rs.put(4, static_cast<uint32_t>(s.get_Kind()));
	rs.put(5, nRemaining);
	rs.put(6, nNextPos);
	rs.put(7, nReserved);
	rs.Step();

	TestChanged1Row();
}

void VaultDB::ShareDel(ShareID id)
{
	Recordset rs(*this, Query::ShareDel, "DELETE FROM " TblShares " WHERE " TblShares_ID "=?");
	rs.put(0, id);
	rs.Step();

	TestChanged1Row();
}

void VaultDB::EnumShares(std::vector<Share>& vRes)
{
	Recordset rs(*this, Query::ShareEnum, "SELECT " TblShares_ID "," TblShares_Owner "," TblShares_Deposit "," TblShares_Yield ","
		TblShares_Kind "," TblShares_Remaining "," TblShares_NextPos "," TblShares_Reserved " FROM " TblShares " ORDER BY " TblShares_ID);

	while (rs.Step())
	{
		vRes.emplace_back();
		Share& s = vRes.back();

		rs.get(0, s.m_ID);
		rs.get(1, s.m_Owner);
		rs.get(2, s.m_DepositValue);
		rs.get(3, s.m_AccruedYield);

		uint32_t nKind;
		rs.get(4, nKind);

		switch (nKind)
		{
		case Share::Kind::Ordinary:
			s.m_State = Share::Ordinary();
			break;

		case Share::Kind::Meta:
			{
				Share::Meta m;
				rs.get(5, m.m_Remaining);
				rs.get(6, m.m_NextPosition);
				rs.get(7, m.m_Reserved);
				s.m_State = m;
			}
			break;

		case Share::Kind::ClosedMeta:
			{
				Share::ClosedMeta cm;
				rs.get(7, cm.m_Reserved);
				s.m_State = cm;
			}
			break;

		default:
			ThrowError(("bad share kind, id=" + std::to_string(s.m_ID)).c_str());
		}
	}
}

namespace
{
	struct Sha256
	{
		struct CtxDel {
			void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
		};

		std::unique_ptr<EVP_MD_CTX, CtxDel> m_pCtx;

		Sha256()
			:m_pCtx(EVP_MD_CTX_new())
		{
			if (!m_pCtx || !EVP_DigestInit_ex(m_pCtx.get(), EVP_sha256(), nullptr))
				throw std::runtime_error("sha256 init failed");
		}

		void Write(const void* p, size_t n)
		{
			if (!EVP_DigestUpdate(m_pCtx.get(), p, n))
				throw std::runtime_error("sha256 update failed");
		}

		// big-endian, fixed width
		void Write(uint64_t x)
		{
			uint8_t p[sizeof(x)];
			for (size_t i = sizeof(x); i--; x >>= 8)
				p[i] = static_cast<uint8_t>(x);
			Write(p, sizeof(p));
		}

		// length-prefixed
		void Write(const std::string& s)
		{
			Write(static_cast<uint64_t>(s.size()));
			Write(s.data(), s.size());
		}

		void Read(VaultDB::Hash& hv)
		{
			unsigned int n = 0;
			if (!EVP_DigestFinal_ex(m_pCtx.get(), hv.data(), &n) || (n != hv.size()))
				throw std::runtime_error("sha256 final failed");
		}
	};
}

void VaultDB::EventRecord::get_Hash(Hash& hv, const Hash& hvPrev) const
{
	Sha256 h;
	h.Write(hvPrev.data(), hvPrev.size());
	h.Write(static_cast<uint64_t>(m_Type));
	h.Write(static_cast<uint64_t>(m_Time));
	h.Write(static_cast<uint64_t>(m_ShareID));
	h.Write(m_Owner);
	h.Write(AmountToString(m_Amount));
	h.Write(m_Body);
	h.Read(hv);
}

void VaultDB::get_LastEvent(uint64_t& nSeq, Hash& hv)
{
	Recordset rs(*this, Query::EventLast, "SELECT " TblEvents_Seq "," TblEvents_Hash " FROM " TblEvents " ORDER BY " TblEvents_Seq " DESC LIMIT 1");
	if (rs.Step())
	{
		rs.get(0, nSeq);
		rs.get(1, hv);
	}
	else
	{
		nSeq = 0;
		hv.fill(0);
	}
}

uint64_t VaultDB::EventInsert(const Event::Any& evt, Timestamp ts)
{
	EventRecord r;
	r.m_Time = ts;
	r.m_Type = Event::get_Type(evt);
	r.m_ShareID = Event::get_ShareID(evt);
	r.m_Owner = Event::get_Owner(evt);
	r.m_Amount = Event::get_Amount(evt);
	r.m_Body = Event::get_Body(evt);

	Hash hvPrev;
	get_LastEvent(r.m_Seq, hvPrev);
	r.m_Seq++;
	r.get_Hash(r.m_Hash, hvPrev);

	Recordset rs(*this, Query::EventIns, "INSERT INTO " TblEvents " (" TblEvents_All ") VALUES(?,?,?,?,?,?,?,?)");
	rs.put(0, r.m_Seq);
	rs.put(1, r.m_Time);
	rs.put(2, static_cast<uint32_t>(r.m_Type));
	rs.put(3, r.m_ShareID);
	rs.put(4, r.m_Owner);
	rs.put(5, r.m_Amount);
	rs.put(6, r.m_Body);
	rs.put(7, r.m_Hash);
	rs.Step();

	TestChanged1Row();
	return r.m_Seq;
}

uint64_t VaultDB::get_EventCount()
{
	Recordset rs(*this, Query::EventCount, "SELECT COUNT(*) FROM " TblEvents);
	rs.StepStrict();

	uint64_t n;
	rs.get(0, n);
	return n;
}

void VaultDB::ReadEvent(Recordset& rs, EventRecord& r)
{
	rs.get(0, r.m_Seq);
	rs.get(1, r.m_Time);

	uint32_t nKind;
	rs.get(2, nKind);
	if (!Event::Type::IsValid(nKind))
		ThrowError(("bad event kind, seq=" + std::to_string(r.m_Seq)).c_str());
	r.m_Type = static_cast<Event::Type::Enum>(nKind);

	rs.get(3, r.m_ShareID);
	rs.get(4, r.m_Owner);
	rs.get(5, r.m_Amount);
	rs.get(6, r.m_Body);
	rs.get(7, r.m_Hash);
}

void VaultDB::EnumEvents(std::vector<EventRecord>& vRes, const Event::Type::Enum* pType, uint32_t nLimit)
{
	// negative limit means no limit in sqlite
	int64_t nLim = nLimit ? static_cast<int64_t>(nLimit) : -1;

	if (pType)
	{
		Recordset rs(*this, Query::EventEnumKind, "SELECT " TblEvents_All " FROM " TblEvents " WHERE " TblEvents_Kind "=? ORDER BY " TblEvents_Seq " DESC LIMIT ?");
		rs.put(0, static_cast<uint32_t>(*pType));
		rs.put(1, nLim);

		while (rs.Step())
		{
			vRes.emplace_back();
			ReadEvent(rs, vRes.back());
		}
	}
	else
	{
		Recordset rs(*this, Query::EventEnum, "SELECT " TblEvents_All " FROM " TblEvents " ORDER BY " TblEvents_Seq " DESC LIMIT ?");
		rs.put(0, nLim);

		while (rs.Step())
		{
			vRes.emplace_back();
			ReadEvent(rs, vRes.back());
		}
	}
}

bool VaultDB::VerifyEventChain(uint64_t& nBadSeq)
{
	Recordset rs(*this, Query::EventEnumAsc, "SELECT " TblEvents_All " FROM " TblEvents " ORDER BY " TblEvents_Seq);

	Hash hvPrev;
	hvPrev.fill(0);
	uint64_t nExpected = 1;

	while (rs.Step())
	{
		EventRecord r;
		ReadEvent(rs, r);

		Hash hv;
		r.get_Hash(hv, hvPrev);

		if ((r.m_Seq != nExpected) || (hv != r.m_Hash))
		{
			nBadSeq = nExpected;
			LOG_ERROR() << "Event chain broken at " << nExpected;
			return false;
		}

		hvPrev = r.m_Hash;
		nExpected++;
	}

	return true;
}

} // namespace xmbl
