/**
 * Copyright 2017 M. Shulhan (ms@kilabit.info). All rights reserved.
 * Use of this source code is governed by a BSD-style license that can be
 * found in the LICENSE file.
 */

#include <strings.h>
#include "RRType.hh"

namespace recursed {

//{{{ RRType

const char* RRType::UNKNOWN = "UNKNOWN";

//
// IANA registry of resource record types, including pseudo and obsolete
// types.
//
const char* RRType::NAMES[] = {
	"A",		"NS",		"MD",		"MF",		"CNAME"
,	"SOA",		"MB",		"MG",		"MR",		"NULL"
,	"WKS",		"PTR",		"HINFO",	"MINFO",	"MX"
,	"TXT",		"RP",		"AFSDB",	"X25",		"ISDN"
,	"RT",		"NSAP",		"NSAP-PTR",	"SIG",		"KEY"
,	"PX",		"GPOS",		"AAAA",		"LOC",		"NXT"
,	"EID",		"NIMLOC",	"SRV",		"ATMA",		"NAPTR"
,	"KX",		"CERT",		"A6",		"DNAME",	"SINK"
,	"OPT",		"APL",		"DS",		"SSHFP",	"IPSECKEY"
,	"RRSIG",	"NSEC",		"DNSKEY",	"DHCID",	"NSEC3"
,	"NSEC3PARAM",	"TLSA",		"SMIMEA",	"HIP",		"NINFO"
,	"RKEY",		"TALINK",	"CDS",		"CDNSKEY",	"OPENPGPKEY"
,	"CSYNC",	"ZONEMD",	"SVCB",		"HTTPS",	"SPF"
,	"UINFO",	"UID",		"GID",		"UNSPEC",	"NID"
,	"L32",		"L64",		"LP",		"EUI48",	"EUI64"
,	"TKEY",		"TSIG",		"IXFR",		"AXFR",		"MAILB"
,	"MAILA",	"*",		"URI",		"CAA",		"DOA"
,	"TA",		"DLV"
};

const uint16_t RRType::VALUES[] = {
	1,	2,	3,	4,	5
,	6,	7,	8,	9,	10
,	11,	12,	13,	14,	15
,	16,	17,	18,	19,	20
,	21,	22,	23,	24,	25
,	26,	27,	28,	29,	30
,	31,	32,	33,	34,	35
,	36,	37,	38,	39,	40
,	41,	42,	43,	44,	45
,	46,	47,	48,	49,	50
,	51,	52,	53,	55,	56
,	57,	58,	59,	60,	61
,	62,	63,	64,	65,	99
,	100,	101,	102,	103,	104
,	105,	106,	107,	108,	109
,	249,	250,	251,	252,	253
,	254,	255,	256,	257,	259
,	32768,	32769
};

const int RRType::SIZE = (int) (sizeof(RRType::VALUES)
				/ sizeof(RRType::VALUES[0]));

/**
 * `GET_VALUE()` will return type code of record type `name`, compared
 * case-insensitively, or -1 if `name` is not a known type.
 */
int RRType::GET_VALUE(const char* name)
{
	if (!name) {
		return -1;
	}

	for (int x = 0; x < SIZE; x++) {
		if (strcasecmp(NAMES[x], name) == 0) {
			return VALUES[x];
		}
	}

	return -1;
}

/**
 * `GET_NAME()` will return the mnemonic of record `type`, or `UNKNOWN` if
 * the type is not in registry.
 */
const char* RRType::GET_NAME(const uint16_t type)
{
	for (int x = 0; x < SIZE; x++) {
		if (VALUES[x] == type) {
			return NAMES[x];
		}
	}

	return UNKNOWN;
}

rdata_kind RRType::GET_RDATA_KIND(const uint16_t type)
{
	switch (type) {
	case RR_T_A:
		return RDATA_IS_INET4;
	case RR_T_AAAA:
		return RDATA_IS_INET6;
	case RR_T_CNAME:
	case RR_T_NS:
		return RDATA_IS_NAME;
	}

	return RDATA_IS_OPAQUE;
}

//
// `IS_CACHEABLE()` will return 1 if records of `type` can be stored in
// zone cache.
//
int RRType::IS_CACHEABLE(const uint16_t type)
{
	switch (type) {
	case RR_T_A:
	case RR_T_AAAA:
	case RR_T_CNAME:
	case RR_T_NS:
		return 1;
	}

	return 0;
}

//}}}
//{{{ RCode

const char* RCode::NAMES[] = {
	"NOERROR",	"FORMERR",	"SERVFAIL",	"NXDOMAIN",	"NOTIMP"
,	"REFUSED",	"YXDOMAIN",	"YXRRSET",	"NXRRSET",	"NOTAUTH"
,	"NOTZONE",	"DSOTYPENI",	"BADVERS",	"BADKEY",	"BADTIME"
,	"BADMODE",	"BADNAME",	"BADALG",	"BADTRUNC",	"BADCOOKIE"
};

const uint16_t RCode::VALUES[] = {
	0,	1,	2,	3,	4
,	5,	6,	7,	8,	9
,	10,	11,	16,	17,	18
,	19,	20,	21,	22,	23
};

const int RCode::SIZE = (int) (sizeof(RCode::VALUES)
				/ sizeof(RCode::VALUES[0]));

int RCode::GET_VALUE(const char* name)
{
	if (!name) {
		return -1;
	}

	for (int x = 0; x < SIZE; x++) {
		if (strcasecmp(NAMES[x], name) == 0) {
			return VALUES[x];
		}
	}

	return -1;
}

const char* RCode::GET_NAME(const int rcode)
{
	for (int x = 0; x < SIZE; x++) {
		if (VALUES[x] == rcode) {
			return NAMES[x];
		}
	}

	return RRType::UNKNOWN;
}

//}}}

} /* namespace::recursed */
