//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "Recursor.hh"

using namespace recursed;

typedef std::function<int(Message*, Message*)> Handler;

//
// FakeUpstream reply to query using handler registered for server address.
// Query to unknown address is a transport failure.
//
class FakeUpstream : public Upstream {
public:
	FakeUpstream() : Upstream(), _handlers(), _asked() {}

	int ask(const char* address, Message* query, Message* answer)
	{
		_asked.push_back(address);

		std::map<std::string, Handler>::iterator it
			= _handlers.find(address);
		if (it == _handlers.end()) {
			return RECURSED_E_TRANSPORT;
		}

		answer->reset();
		answer->_id = query->_id;
		answer->_is_response = 1;
		answer->_rcode = RCODE_NOERROR;

		CHECK(query->_rd == 0);

		return it->second(query, answer);
	}

	std::map<std::string, Handler>	_handlers;
	std::vector<std::string>	_asked;
};

static std::string str(Buffer* b)
{
	if (b->is_empty()) {
		return std::string();
	}
	return std::string(b->v(), b->len());
}

static std::string qname(Message* q)
{
	return str(&((RR*) q->_qstn.at(0))->_name);
}

static void add(List* section, uint16_t type, const char* name
		, const char* value, int32_t ttl = 300)
{
	section->push_tail(new RR(type, name, value, ttl));
}

static void seed(ZoneCache* cache, uint16_t type, const char* name
		, const char* value, int32_t ttl = -1)
{
	RR rr(type, name, value, ttl);
	cache->insert_copy(&rr);
}

static void seed_test_root(ZoneCache* cache)
{
	seed(cache, RR_T_NS, "", "ns.root.test");
	seed(cache, RR_T_A, "ns.root.test", "192.0.2.1");
}

TEST_CASE("Recursor: iterative query return closest delegation"
	, "[recursor][iterative]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	cache.load_default_hints();

	REQUIRE(rec.query(RR_T_A, "www.example.com", 0, &answers
			, &additional) == RECURSOR_OK);

	CHECK(answers.size() == 13);
	for (int x = 0; x < answers.size(); x++) {
		CHECK(((RR*) answers.at(x))->_type == RR_T_NS);
		CHECK(str(&((RR*) answers.at(x))->_name) == "");
	}
	CHECK(additional.size() == 13);
	for (int x = 0; x < additional.size(); x++) {
		CHECK(((RR*) additional.at(x))->_type == RR_T_A);
	}
	CHECK(up._asked.empty());

	list_clear(&answers);
	list_clear(&additional);
}

TEST_CASE("Recursor: cached root server address without I/O"
	, "[recursor][iterative]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	cache.load_default_hints();

	REQUIRE(rec.query(RR_T_A, "a.root-servers.net", 0, &answers
			, &additional) == RECURSOR_OK);

	REQUIRE(answers.size() == 1);
	CHECK(((RR*) answers.at(0))->_type == RR_T_A);
	CHECK(str(&((RR*) answers.at(0))->_value) == "198.41.0.4");
	CHECK(additional.size() == 0);
	CHECK(up._asked.empty());

	list_clear(&answers);
}

TEST_CASE("Recursor: CNAME is returned when type is not cached"
	, "[recursor][cname]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	cache.load_default_hints();
	seed(&cache, RR_T_CNAME, "www.example.com", "example.com", 300);

	REQUIRE(rec.query(RR_T_A, "www.example.com", 1, &answers
			, &additional) == RECURSOR_OK);

	REQUIRE(answers.size() == 1);
	CHECK(((RR*) answers.at(0))->_type == RR_T_CNAME);
	CHECK(str(&((RR*) answers.at(0))->_value) == "example.com");
	CHECK(up._asked.empty());

	list_clear(&answers);
}

TEST_CASE("Recursor: NXDOMAIN stop resolution", "[recursor][nxdomain]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed(&cache, RR_T_NS, "", "ns1.root.test");
	seed(&cache, RR_T_NS, "", "ns2.root.test");
	seed(&cache, RR_T_A, "ns1.root.test", "192.0.2.1");
	seed(&cache, RR_T_A, "ns2.root.test", "192.0.2.2");

	up._handlers["192.0.2.1"] = [](Message*, Message* a) {
		a->_rcode = RCODE_NXDOMAIN;
		return 0;
	};
	up._handlers["192.0.2.2"] = [](Message* q, Message* a) {
		add(&a->_answ, RR_T_A, qname(q).c_str(), "10.0.0.1");
		return 0;
	};

	CHECK(rec.query(RR_T_A, "nope.example", 1, &answers, &additional)
		== RECURSOR_NOT_EXIST);

	CHECK(answers.size() == 0);
	CHECK(additional.size() == 0);
	REQUIRE(up._asked.size() == 1);
	CHECK(up._asked[0] == "192.0.2.1");
}

TEST_CASE("Recursor: recursive query follow delegation chain"
	, "[recursor][recursive]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed_test_root(&cache);

	up._handlers["192.0.2.1"] = [](Message*, Message* a) {
		add(&a->_auth, RR_T_NS, "com", "ns.com.test");
		add(&a->_addt, RR_T_A, "ns.com.test", "192.0.2.10");
		return 0;
	};
	up._handlers["192.0.2.10"] = [](Message*, Message* a) {
		add(&a->_auth, RR_T_NS, "example.com", "ns.example.test");
		add(&a->_addt, RR_T_A, "ns.example.test", "192.0.2.20");
		return 0;
	};
	up._handlers["192.0.2.20"] = [](Message* q, Message* a) {
		add(&a->_answ, RR_T_A, qname(q).c_str(), "93.184.216.34");
		return 0;
	};

	REQUIRE(rec.query(RR_T_A, "www.example.com", 1, &answers
			, &additional) == RECURSOR_OK);

	REQUIRE(answers.size() == 1);
	CHECK(str(&((RR*) answers.at(0))->_name) == "www.example.com");
	CHECK(str(&((RR*) answers.at(0))->_value) == "93.184.216.34");

	REQUIRE(up._asked.size() == 3);
	CHECK(up._asked[0] == "192.0.2.1");
	CHECK(up._asked[1] == "192.0.2.10");
	CHECK(up._asked[2] == "192.0.2.20");

	list_clear(&answers);
	list_clear(&additional);

	// Second query is answered from cache.
	REQUIRE(rec.query(RR_T_A, "WWW.example.com", 1, &answers
			, &additional) == RECURSOR_OK);
	CHECK(answers.size() == 1);
	CHECK(up._asked.size() == 3);

	list_clear(&answers);
}

TEST_CASE("Recursor: failed server is skipped", "[recursor][recursive]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed(&cache, RR_T_NS, "", "ns1.root.test");
	seed(&cache, RR_T_NS, "", "ns2.root.test");
	seed(&cache, RR_T_NS, "", "ns3.root.test");
	seed(&cache, RR_T_A, "ns1.root.test", "192.0.2.1");
	seed(&cache, RR_T_A, "ns2.root.test", "192.0.2.2");
	seed(&cache, RR_T_A, "ns3.root.test", "192.0.2.3");

	// 192.0.2.1 is not registered, a transport failure.
	up._handlers["192.0.2.2"] = [](Message*, Message* a) {
		a->_rcode = RCODE_SERVFAIL;
		return 0;
	};
	up._handlers["192.0.2.3"] = [](Message* q, Message* a) {
		add(&a->_answ, RR_T_A, qname(q).c_str(), "10.1.1.1");
		return 0;
	};

	REQUIRE(rec.query(RR_T_A, "host.example", 1, &answers, &additional)
		== RECURSOR_OK);

	REQUIRE(answers.size() == 1);
	CHECK(str(&((RR*) answers.at(0))->_value) == "10.1.1.1");

	REQUIRE(up._asked.size() == 3);
	CHECK(up._asked[0] == "192.0.2.1");
	CHECK(up._asked[1] == "192.0.2.2");
	CHECK(up._asked[2] == "192.0.2.3");

	list_clear(&answers);
}

TEST_CASE("Recursor: all servers fail", "[recursor][recursive]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed(&cache, RR_T_NS, "", "ns1.root.test");
	seed(&cache, RR_T_NS, "", "ns2.root.test");
	seed(&cache, RR_T_A, "ns1.root.test", "192.0.2.1");
	seed(&cache, RR_T_A, "ns2.root.test", "192.0.2.2");

	up._handlers["192.0.2.2"] = [](Message*, Message* a) {
		a->_rcode = RCODE_REFUSED;
		return 0;
	};

	CHECK(rec.query(RR_T_A, "host.example", 1, &answers, &additional)
		== RECURSOR_FAIL);
	CHECK(answers.size() == 0);
	CHECK(up._asked.size() == 2);
}

TEST_CASE("Recursor: hop limit end endless referral", "[recursor][hops]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up, 3);
	List answers;
	List additional;
	int n = 0;
	const char* zones[] = {
		"example", "loop.example", "f.loop.example", "e.f.loop.example"
	,	"d.e.f.loop.example"
	};

	seed_test_root(&cache);

	// Each reply refer to a zone one label deeper, served by the same
	// address.
	up._handlers["192.0.2.1"] = [&n, &zones](Message*, Message* a) {
		add(&a->_auth, RR_T_NS, zones[n], "ns.root.test");
		add(&a->_addt, RR_T_A, "ns.root.test", "192.0.2.1");
		n++;
		return 0;
	};

	CHECK(rec.query(RR_T_A, "a.b.c.d.e.f.loop.example", 1, &answers
		, &additional) == RECURSOR_FAIL);
	CHECK(answers.size() == 0);
	CHECK(up._asked.size() == 3);
}

TEST_CASE("Recursor: referral back to the same zone is not a progress"
	, "[recursor][recursive]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;
	List ns;

	seed_test_root(&cache);
	seed(&cache, RR_T_NS, "example.com", "ns.ex.test", 300);
	seed(&cache, RR_T_A, "ns.ex.test", "192.0.2.5", 300);

	up._handlers["192.0.2.5"] = [](Message*, Message* a) {
		add(&a->_auth, RR_T_NS, "example.com", "ns.ex.test");
		add(&a->_addt, RR_T_A, "ns.ex.test", "192.0.2.5");
		return 0;
	};

	CHECK(rec.query(RR_T_A, "www.example.com", 1, &answers, &additional)
		== RECURSOR_OK);
	CHECK(answers.size() == 0);
	REQUIRE(up._asked.size() == 1);
	CHECK(up._asked[0] == "192.0.2.5");

	CHECK(cache.lookup("example.com", RR_T_NS, &ns) == 1);
	list_clear(&ns);
	CHECK(cache.lookup("ns.ex.test", RR_T_A, &ns) == 1);
	list_clear(&ns);
}

TEST_CASE("Recursor: lame server is skipped for the next one"
	, "[recursor][recursive]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed(&cache, RR_T_NS, "", "ns1.root.test");
	seed(&cache, RR_T_NS, "", "ns2.root.test");
	seed(&cache, RR_T_A, "ns1.root.test", "192.0.2.1");
	seed(&cache, RR_T_A, "ns2.root.test", "192.0.2.2");

	// Referral to the root again, and to an unrelated zone.
	up._handlers["192.0.2.1"] = [](Message*, Message* a) {
		add(&a->_auth, RR_T_NS, "", "ns1.root.test");
		add(&a->_auth, RR_T_NS, "other.test", "ns.other.test");
		return 0;
	};
	up._handlers["192.0.2.2"] = [](Message* q, Message* a) {
		add(&a->_answ, RR_T_A, qname(q).c_str(), "10.2.2.2");
		return 0;
	};

	REQUIRE(rec.query(RR_T_A, "host.example", 1, &answers, &additional)
		== RECURSOR_OK);
	REQUIRE(answers.size() == 1);
	CHECK(str(&((RR*) answers.at(0))->_value) == "10.2.2.2");
	REQUIRE(up._asked.size() == 2);
	CHECK(up._asked[0] == "192.0.2.1");
	CHECK(up._asked[1] == "192.0.2.2");

	list_clear(&answers);
	CHECK(cache.lookup("other.test", RR_T_NS, &answers) == 0);
}

TEST_CASE("Recursor: answer with zero TTL is returned once asked"
	, "[recursor][ttl]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed_test_root(&cache);

	up._handlers["192.0.2.1"] = [](Message* q, Message* a) {
		add(&a->_answ, RR_T_A, qname(q).c_str(), "10.0.0.1", 0);
		return 0;
	};

	REQUIRE(rec.query(RR_T_A, "host.example", 1, &answers, &additional)
		== RECURSOR_OK);
	REQUIRE(answers.size() == 1);
	CHECK(str(&((RR*) answers.at(0))->_value) == "10.0.0.1");
	CHECK(((RR*) answers.at(0))->_ttl == 0);
	CHECK(up._asked.size() == 1);

	list_clear(&answers);
}

TEST_CASE("Recursor: CNAME from upstream is the answer"
	, "[recursor][cname]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed_test_root(&cache);

	up._handlers["192.0.2.1"] = [](Message*, Message* a) {
		add(&a->_answ, RR_T_CNAME, "www.example.com", "web.example.com");
		add(&a->_answ, RR_T_A, "web.example.com", "10.3.3.3");
		return 0;
	};

	REQUIRE(rec.query(RR_T_A, "www.example.com", 1, &answers
			, &additional) == RECURSOR_OK);
	REQUIRE(answers.size() == 1);
	CHECK(((RR*) answers.at(0))->_type == RR_T_CNAME);
	CHECK(str(&((RR*) answers.at(0))->_value) == "web.example.com");
	CHECK(up._asked.size() == 1);

	list_clear(&answers);
}

TEST_CASE("Recursor: label counting and zone membership", "[recursor]")
{
	CHECK(Recursor::COUNT_LABELS("") == 0);
	CHECK(Recursor::COUNT_LABELS("com") == 1);
	CHECK(Recursor::COUNT_LABELS("www.example.com") == 3);

	CHECK(Recursor::IS_SUBDOMAIN("www.example.com", "") == 1);
	CHECK(Recursor::IS_SUBDOMAIN("www.example.com", "example.com") == 1);
	CHECK(Recursor::IS_SUBDOMAIN("example.com", "example.com") == 1);
	CHECK(Recursor::IS_SUBDOMAIN("www.myexample.com", "example.com") == 0);
	CHECK(Recursor::IS_SUBDOMAIN("com", "example.com") == 0);
}

TEST_CASE("Recursor: answer without cacheable records end resolution"
	, "[recursor][recursive]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed_test_root(&cache);

	up._handlers["192.0.2.1"] = [](Message*, Message* a) {
		add(&a->_auth, RR_T_SOA, "example", "soa");
		return 0;
	};

	CHECK(rec.query(RR_T_AAAA, "host.example", 1, &answers, &additional)
		== RECURSOR_OK);
	CHECK(answers.size() == 0);
	CHECK(additional.size() == 0);
	CHECK(up._asked.size() == 1);
}

TEST_CASE("Recursor: name server without glue is resolved first"
	, "[recursor][recursive]")
{
	ZoneCache cache;
	FakeUpstream up;
	Recursor rec(&cache, &up);
	List answers;
	List additional;

	seed_test_root(&cache);

	up._handlers["192.0.2.1"] = [](Message* q, Message* a) {
		if (qname(q) == "ns.glueless.test") {
			add(&a->_answ, RR_T_A, "ns.glueless.test"
				, "192.0.2.30");
		} else {
			add(&a->_auth, RR_T_NS, "example.com"
				, "ns.glueless.test");
		}
		return 0;
	};
	up._handlers["192.0.2.30"] = [](Message* q, Message* a) {
		add(&a->_answ, RR_T_A, qname(q).c_str(), "93.184.216.34");
		return 0;
	};

	REQUIRE(rec.query(RR_T_A, "www.example.com", 1, &answers
			, &additional) == RECURSOR_OK);

	REQUIRE(answers.size() == 1);
	CHECK(str(&((RR*) answers.at(0))->_value) == "93.184.216.34");

	REQUIRE(up._asked.size() == 3);
	CHECK(up._asked[0] == "192.0.2.1");
	CHECK(up._asked[1] == "192.0.2.1");
	CHECK(up._asked[2] == "192.0.2.30");

	list_clear(&answers);
}
