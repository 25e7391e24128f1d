//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <stdio.h>
#include <unistd.h>
#include "ZoneCache.hh"

using namespace recursed;

static std::string str(Buffer* b)
{
	if (b->is_empty()) {
		return std::string();
	}
	return std::string(b->v(), b->len());
}

TEST_CASE("Zone: record with ttl 1 expire after one second", "[cache][ttl]")
{
	Zone zone;
	List out;
	RR* rr = new RR(RR_T_A, "example.com", "10.0.0.1", 1);
	double t = rr->_fetched_at;

	zone.add(rr);

	CHECK(zone.get_records(RR_T_A, &out, t + 0.5) == 1);
	CHECK(zone._rr.size() == 1);
	list_clear(&out);

	CHECK(zone.get_records(RR_T_A, &out, t + 1.5) == 0);
	CHECK(out.size() == 0);
	CHECK(zone._rr.size() == 0);
}

TEST_CASE("Zone: copy from cache carry remaining TTL", "[cache][ttl]")
{
	Zone zone;
	List out;
	RR* rr = new RR(RR_T_A, "example.com", "10.0.0.1", 100);
	RR* hint = new RR(RR_T_A, "example.com", "10.0.0.2", -1);
	double t = rr->_fetched_at;

	zone.add(rr);
	zone.add(hint);

	REQUIRE(zone.get_records(RR_T_A, &out, t + 40) == 2);

	int ttl = ((RR*) out.at(0))->_ttl;
	CHECK(ttl >= 60);
	CHECK(ttl <= 61);
	CHECK(((RR*) out.at(1))->_ttl == -1);

	// Records in zone is not modified.
	CHECK(rr->_ttl == 100);

	list_clear(&out);
}

TEST_CASE("Zone: remaining TTL is rounded up to the next second"
	, "[cache][ttl]")
{
	Zone zone;
	List out;
	RR* rr = new RR(RR_T_A, "example.com", "10.0.0.1", 10);
	double t = rr->_fetched_at;

	zone.add(rr);

	REQUIRE(zone.get_records(RR_T_A, &out, t + 9.1) == 1);
	CHECK(((RR*) out.at(0))->_ttl == 1);
	list_clear(&out);

	REQUIRE(zone.get_records(RR_T_A, &out, t + 4.5) == 1);
	CHECK(((RR*) out.at(0))->_ttl == 6);
	list_clear(&out);

	CHECK(Zone::REMAINING_TTL(rr, t + 9.999) == 1);
	CHECK(Zone::REMAINING_TTL(rr, t) == 10);
}

TEST_CASE("Zone: expired records are purged, others kept in order"
	, "[cache][ttl]")
{
	Zone zone;
	List out;
	RR* a = new RR(RR_T_A, "x.org", "10.0.0.1", 10);
	RR* ns = new RR(RR_T_NS, "x.org", "ns.x.org", 1);
	RR* b = new RR(RR_T_A, "x.org", "10.0.0.2", 10);
	double t = a->_fetched_at;

	zone.add(a);
	zone.add(ns);
	zone.add(b);

	CHECK(zone.purge(t + 5) == 1);
	REQUIRE(zone._rr.size() == 2);
	CHECK(zone._rr.at(0) == a);
	CHECK(zone._rr.at(1) == b);
}

TEST_CASE("ZoneCache: insert create the chain of zones", "[cache]")
{
	ZoneCache cache;
	Zone* zone = NULL;
	int n_labels = 0;
	int n_matched = 0;
	RR rr(RR_T_A, "www.example.com", "93.184.216.34", 300);

	REQUIRE(cache.insert_copy(&rr) == 1);

	REQUIRE(cache._root._child.size() == 1);
	Zone* com = (Zone*) cache._root._child.at(0);
	CHECK(str(&com->_label) == "com");
	REQUIRE(com->_child.size() == 1);
	Zone* example = (Zone*) com->_child.at(0);
	CHECK(str(&example->_label) == "example");
	CHECK(example->_parent == com);

	cache.get_zone("WWW.EXAMPLE.COM.", &zone, &n_labels, &n_matched);
	CHECK(n_labels == 3);
	CHECK(n_matched == 3);
	REQUIRE(zone != NULL);
	CHECK(str(&zone->_label) == "www");
	CHECK(zone->_parent == example);

	Buffer name;
	zone->get_name(&name);
	CHECK(str(&name) == "www.example.com");

	// Inserting a sibling only create the missing zone.
	RR mail(RR_T_A, "mail.example.com", "93.184.216.35", 300);
	REQUIRE(cache.insert_copy(&mail) == 1);
	CHECK(cache._root._child.size() == 1);
	CHECK(example->_child.size() == 2);
}

TEST_CASE("ZoneCache: get_zone return the closest zone", "[cache]")
{
	ZoneCache cache;
	Zone* zone = NULL;
	int n_labels = 0;
	int n_matched = 0;
	RR rr(RR_T_NS, "example.com", "ns1.example.com", 300);

	cache.insert_copy(&rr);

	cache.get_zone("a.b.example.com", &zone, &n_labels, &n_matched);
	CHECK(n_labels == 4);
	CHECK(n_matched == 2);
	REQUIRE(zone != NULL);
	CHECK(str(&zone->_label) == "example");

	cache.get_zone("example.net", &zone, &n_labels, &n_matched);
	CHECK(n_labels == 2);
	CHECK(n_matched == 0);
	CHECK(zone == &cache._root);

	cache.get_zone("", &zone, &n_labels, &n_matched);
	CHECK(n_labels == 0);
	CHECK(n_matched == 0);
	CHECK(zone == &cache._root);
}

TEST_CASE("ZoneCache: duplicates are kept and only cacheable types stored"
	, "[cache]")
{
	ZoneCache cache;
	List out;
	List in;

	in.push_tail(new RR(RR_T_A, "example.com", "10.0.0.1", 60));
	in.push_tail(new RR(RR_T_A, "example.com", "10.0.0.1", 60));
	in.push_tail(new RR(RR_T_MX, "example.com", "mail", 60));
	in.push_tail(new RR(RR_T_SOA, "example.com", "soa", 60));

	CHECK(cache.insert(&in) == 2);
	CHECK(cache.lookup("example.com", RR_T_A, &out) == 2);
	list_clear(&out);

	CHECK(cache.lookup("example.com", RR_T_MX, &out) == 0);
	CHECK(cache.lookup("www.example.com", RR_T_A, &out) == 0);

	list_clear(&in);
}

TEST_CASE("ZoneCache: built-in root hints", "[cache][hints]")
{
	ZoneCache cache;
	List out;

	REQUIRE(cache.load_default_hints() == 0);

	CHECK(cache.lookup("", RR_T_NS, &out) == 13);
	list_clear(&out);

	CHECK(cache.lookup("root-servers.net", RR_T_NS, &out) == 13);
	list_clear(&out);

	REQUIRE(cache.lookup("a.root-servers.net", RR_T_A, &out) == 1);
	CHECK(str(&((RR*) out.at(0))->_value) == "198.41.0.4");
	CHECK(((RR*) out.at(0))->_ttl == -1);
	list_clear(&out);
}

TEST_CASE("ZoneCache: load hints from file", "[cache][hints]")
{
	ZoneCache cache;
	List out;
	char path[] = "/tmp/recursed-hints-XXXXXX";
	int fd = mkstemp(path);

	REQUIRE(fd >= 0);

	FILE* f = fdopen(fd, "w");
	REQUIRE(f != NULL);
	fputs("; root hints\n", f);
	fputs(".                        3600000      NS    x.root.test.\n", f);
	fputs("x.root.test.             3600000      A     192.0.2.1\n", f);
	fputs("x.root.test.             3600000  IN  AAAA  2001:db8::53\n", f);
	fputs("x.root.test.             3600000      MX    ignored\n", f);
	fclose(f);

	REQUIRE(cache.load_hints(path) == 0);
	unlink(path);

	REQUIRE(cache.lookup(".", RR_T_NS, &out) == 1);
	CHECK(str(&((RR*) out.at(0))->_value) == "x.root.test");
	CHECK(((RR*) out.at(0))->_ttl == -1);
	list_clear(&out);

	REQUIRE(cache.lookup("x.root.test", RR_T_A, &out) == 1);
	CHECK(str(&((RR*) out.at(0))->_value) == "192.0.2.1");
	list_clear(&out);

	CHECK(cache.lookup("x.root.test", RR_T_AAAA, &out) == 1);
	list_clear(&out);

	CHECK(cache.load_hints("/nonexistent/recursed.hints") == -1);
}
