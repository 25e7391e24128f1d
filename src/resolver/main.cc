/**
 * Copyright 2017 M. Shulhan (ms@kilabit.info). All rights reserved.
 * Use of this source code is governed by a BSD-style license that can be
 * found in the LICENSE file.
 */

#include <stdlib.h>
#include <strings.h>
#include <time.h>
#include <unistd.h>
#include "main.hh"

using namespace recursed;

void usage()
{
	int x = 0;

	dlog.er("resolver [@server[:port]] [type] hostname [%s]\n\n"
		, OPT_NORECURSE);
	dlog.er("Supported type:\n\t");

	for (; x < RRType::SIZE; x++) {
		if (x > 0) {
			dlog.er(" ");
		}
		dlog.er("%s", RRType::NAMES[x]);
	}
	dlog.er("\n");

	exit(1);
}

//
// `parse_server()` will split "address[:port]" into address and port.
//
int parse_server(const char* v, Buffer* address, uint16_t* port)
{
	int s = 0;
	long int li_port = 0;
	List* addr_port = NULL;

	s = address->copy_raw(v);
	if (s != 0) {
		return -1;
	}

	addr_port = address->split_by_char(':', 1);
	if (!addr_port) {
		return -1;
	}

	if (addr_port->size() >= 2) {
		address->copy((Buffer*) addr_port->at(0));

		s = ((Buffer*) addr_port->at(1))->to_lint(&li_port);
		if (s != 0 || li_port <= 0 || li_port > 65535) {
			dlog.er("Invalid port: %s\n", v);
			delete addr_port;
			return -1;
		}
		*port = (uint16_t) li_port;
	}

	delete addr_port;

	if (!SockAddr::IS_IPV4(address->chars())) {
		dlog.er("Invalid server address: %s\n", v);
		return -1;
	}

	return 0;
}

int query(List* ns, const uint16_t port, const char* stype
		, const char* sname, const int recursive)
{
	int s = 0;
	int type = 0;
	Message Q;
	Message A;
	UpstreamUDP U(port, RECURSED_DEF_TIMEOUT);
	const char* address = NULL;

	type = RRType::GET_VALUE(stype);
	if (type < 0) {
		dlog.er("Invalid type: %s\n", stype);
		return -1;
	}

	s = U.init();
	if (s) {
		return -1;
	}

	for (int x = 0; x < ns->size(); x++) {
		address = ns->at(x)->chars();

		Q.set_question((uint16_t) type, sname);
		Q._rd = recursive ? 1 : 0;
		A.reset();

		s = U.ask(address, &Q, &A);
		if (s == 0) {
			dlog.out(";; SERVER: %s#%d\n%s\n", address, port
				, A.chars());
			return 0;
		}

		dlog.er(";; no answer from %s\n", address);
	}

	return 1;
}

List* load_etc_resolv()
{
	int x = 0;
	List* ns = NULL;
	List* cols = NULL;
	Rowset* rs = NULL;
	const char* v = NULL;

	SSVReader reader('#');

	x = reader.load(DEF_ETC_RESOLV);
	if (x) {
		dlog.er("Fail to load %s!\n", DEF_ETC_RESOLV);
		return NULL;
	}

	ns = new List();
	rs = reader._rows;

	for (x = 0; x < rs->size(); x++) {
		cols = (List*) rs->at(x);

		if (cols->size() <= 1) {
			continue;
		}

		v = cols->at(0)->chars();
		if (strcasecmp(v, "nameserver") != 0) {
			continue;
		}

		v = cols->at(1)->chars();
		if (!SockAddr::IS_IPV4(v)) {
			continue;
		}

		ns->push_tail(new Buffer(v));
	}

	if (ns->size() <= 0) {
		dlog.er("No nameserver defined in %s\n", DEF_ETC_RESOLV);
		delete ns;
		ns = NULL;
	}

	return ns;
}

//
// $ resolver hostname
// $ resolver type hostname
// $ resolver @127.0.0.1 hostname
// $ resolver @127.0.0.1:5353 TYPE hostname +norecurse
//
int main(int argc, char* argv[])
{
	int s = 1;
	int npos = 0;
	int recursive = 1;
	uint16_t port = RECURSED_DNS_PORT;
	const char* server = NULL;
	const char* pos[2] = { NULL, NULL };
	const char* stype = DEF_QTYPE;
	const char* sname = NULL;
	Buffer address;
	List* ns = NULL;

	for (int x = 1; x < argc; x++) {
		if (argv[x][0] == '@') {
			if (server || !argv[x][1]) {
				usage();
			}
			server = &argv[x][1];
		} else if (strcasecmp(argv[x], OPT_NORECURSE) == 0) {
			recursive = 0;
		} else {
			if (npos >= 2) {
				usage();
			}
			pos[npos++] = argv[x];
		}
	}

	switch (npos) {
	case 1:
		sname = pos[0];
		break;
	case 2:
		stype = pos[0];
		sname = pos[1];
		break;
	default:
		usage();
	}

	srandom((unsigned int) time(NULL) ^ (unsigned int) getpid());

	if (server) {
		if (parse_server(server, &address, &port) != 0) {
			return 1;
		}
		ns = new List();
		ns->push_tail(new Buffer(address.chars()));
	} else {
		ns = load_etc_resolv();
		if (!ns) {
			return 1;
		}
	}

	s = query(ns, port, stype, sname, recursive);

	delete ns;

	if (s < 0) {
		usage();
	}

	return s;
}
