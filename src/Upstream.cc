//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include <arpa/inet.h>
#include <errno.h>
#include <string.h>
#include <sys/select.h>
#include "Upstream.hh"

namespace recursed {

const char* UpstreamUDP::__cname = "UpstreamUDP";

UpstreamUDP::UpstreamUDP(const uint16_t port, const uint8_t timeout)
: Upstream()
, _port(port)
, _timeout(timeout)
, _sock()
, _fd_read()
, _is_ready(0)
{
	FD_ZERO(&_fd_read);
}

UpstreamUDP::~UpstreamUDP()
{}

/**
 * `init()` will create the UDP socket. It will return 0 on success or -1
 * if socket can not be created.
 */
int UpstreamUDP::init()
{
	if (_is_ready) {
		return 0;
	}

	int s = _sock.create_udp();
	if (s != 0) {
		dlog.er("%s: fail to create datagram socket\n", __cname);
		return -1;
	}

	_is_ready = 1;

	return 0;
}

/**
 * @method	: UpstreamUDP::ask
 * @param	:
 *	> address : IPv4 address of upstream server.
 *	> query   : query to be send.
 *	> answer  : return value, decoded reply from server.
 * @return	:
 *	< 0	: success.
 *	< RECURSED_E_TRANSPORT : fail to send, or no reply in `_timeout`
 *				 seconds.
 *	< RECURSED_E_FORMAT    : reply can not be decoded.
 */
int UpstreamUDP::ask(const char* address, Message* query, Message* answer)
{
	int s = 0;
	Buffer packet;
	struct sockaddr_in to;

	if (init() != 0) {
		return RECURSED_E_TRANSPORT;
	}

	memset(&to, 0, sizeof(to));
	to.sin_family = AF_INET;
	to.sin_port = htons(_port);

	if (!address || inet_pton(AF_INET, address, &to.sin_addr) != 1) {
		dlog.er("%s: invalid server address '%s'\n", __cname
			, address ? address : "");
		return RECURSED_E_TRANSPORT;
	}

	s = query->pack(&packet);
	if (s != 0) {
		return s;
	}

	if (DBG_LVL_IS_2) {
		dlog.out("%s: send %d bytes to %s:%d\n", __cname
			, (int) packet.len(), address, _port);
	}

	if (_sock.send_udp(&to, &packet) < 0) {
		dlog.er("%s: fail to send query to %s\n", __cname, address);
		return RECURSED_E_TRANSPORT;
	}

	return wait_answer(&to, query, answer);
}

//
// `wait_answer()` will read datagrams until one from `to` with the same ID
// as `query` received, or until timeout.
//
int UpstreamUDP::wait_answer(struct sockaddr_in* to, Message* query
				, Message* answer)
{
	int s = 0;
	ssize_t len = 0;
	uint16_t id = 0;
	double left = 0;
	double deadline = time_now() + (double) _timeout;
	const unsigned char* v = NULL;
	struct timeval timeout;
	struct sockaddr_in from;

	while (1) {
		left = deadline - time_now();
		if (left <= 0) {
			break;
		}

		FD_ZERO(&_fd_read);
		FD_SET(_sock._d, &_fd_read);

		timeout.tv_sec	= (time_t) left;
		timeout.tv_usec	= (suseconds_t) ((left - (double) timeout.tv_sec)
						* 1000000.0);

		s = select(_sock._d + 1, &_fd_read, NULL, NULL, &timeout);
		if (s < 0) {
			if (EINTR == errno) {
				continue;
			}
			return RECURSED_E_TRANSPORT;
		}
		if (s == 0) {
			break;
		}

		memset(&from, 0, sizeof(from));

		len = _sock.recv_udp(&from);
		if (len < RECURSED_HEADER_SIZE) {
			continue;
		}
		if (from.sin_addr.s_addr != to->sin_addr.s_addr) {
			if (DBG_LVL_IS_2) {
				dlog.out("%s: drop reply from unknown server\n"
					, __cname);
			}
			continue;
		}

		v = (const unsigned char*) _sock.v();
		id = (uint16_t) ((v[0] << 8) | v[1]);

		if (id != query->_id) {
			if (DBG_LVL_IS_2) {
				dlog.out("%s: drop reply with id %d, expecting"
					" %d\n", __cname, id, query->_id);
			}
			continue;
		}

		s = answer->unpack(_sock.v(), (int) _sock.len());
		if (s != 0) {
			dlog.er("%s: invalid reply from %s\n", __cname
				, inet_ntoa(to->sin_addr));
			return RECURSED_E_FORMAT;
		}

		return 0;
	}

	if (DBG_LVL_IS_1) {
		dlog.out("%s: timeout waiting reply from %s\n", __cname
			, inet_ntoa(to->sin_addr));
	}

	return RECURSED_E_TRANSPORT;
}

} /* namespace::recursed */
// vi: ts=8 sw=8 tw=78:
