#include "hb/rawdns.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#ifdef HB_HAVE_LDNS
#include <sys/time.h>

#include <ldns/ldns.h>
#endif

namespace hb
{
namespace
{
RawDnsResult failed(RawDnsErrorKind kind, std::string msg)
{
    RawDnsResult r{};
    r.rc = -1;
    r.kind = kind;
    r.error = std::move(msg);
    return r;
}

#ifdef HB_HAVE_LDNS
struct ResolverFree
{
    void operator()(ldns_resolver *r) const { ldns_resolver_deep_free(r); }
};
struct RdfFree
{
    void operator()(ldns_rdf *r) const { ldns_rdf_deep_free(r); }
};
struct PktFree
{
    void operator()(ldns_pkt *p) const { ldns_pkt_free(p); }
};
using ResolverPtr = std::unique_ptr<ldns_resolver, ResolverFree>;
using RdfPtr = std::unique_ptr<ldns_rdf, RdfFree>;
using PktPtr = std::unique_ptr<ldns_pkt, PktFree>;

RdfPtr server_address(const std::string &ns)
{
    const bool v6 = ns.find(':') != std::string::npos;
    return RdfPtr(ldns_rdf_new_frm_str(v6 ? LDNS_RDF_TYPE_AAAA : LDNS_RDF_TYPE_A, ns.c_str()));
}

// Collects the address rdata of every `type` record in the answer section.
// Returns false when the query itself failed.
bool lookup(ldns_resolver *res, const ldns_rdf *name, ldns_rr_type type,
            std::vector<std::string> &out)
{
    ldns_pkt *raw = nullptr;
    const ldns_status st = ldns_resolver_query_status(
        &raw, res, name, type, LDNS_RR_CLASS_IN, LDNS_RD);
    PktPtr pkt(raw);
    if (st != LDNS_STATUS_OK || !pkt) return false;

    const ldns_rr_list *answer = ldns_pkt_answer(pkt.get());
    if (!answer) return true;
    for (size_t i = 0; i < ldns_rr_list_rr_count(answer); ++i)
    {
        const ldns_rr *rr = ldns_rr_list_rr(answer, i);
        // CNAMEs share the section with the addresses they lead to
        if (ldns_rr_get_type(rr) != type || ldns_rr_rd_count(rr) == 0) continue;
        char *text = ldns_rdf2str(ldns_rr_rdf(rr, 0));
        if (!text) continue;
        out.emplace_back(text);
        LDNS_FREE(text);
    }
    return true;
}
#endif
} // namespace

RawDnsResult resolve_rawdns(const std::string &host,
                            const std::string &ns,
                            DnsStrategy strategy,
                            int timeout_ms)
{
#ifndef HB_HAVE_LDNS
    (void) host;
    (void) strategy;
    (void) timeout_ms;
    return failed(RawDnsErrorKind::NotAvailable,
                  "--dns-server " + ns + " needs ldns, which this build lacks");
#else
    ResolverPtr res(ldns_resolver_new());
    if (!res) return failed(RawDnsErrorKind::InitFailed, "cannot create ldns resolver");

    RdfPtr server = server_address(ns);
    if (!server) return failed(RawDnsErrorKind::InitFailed, "invalid DNS server address: " + ns);
    // push_nameserver copies the rdf
    const ldns_status pushed = ldns_resolver_push_nameserver(res.get(), server.get());
    if (pushed != LDNS_STATUS_OK)
        return failed(RawDnsErrorKind::InitFailed,
                      std::string("cannot use DNS server: ") + ldns_get_errorstr_by_id(pushed));

    ldns_resolver_set_recursive(res.get(), true);
    ldns_resolver_set_fallback(res.get(), true);
    ldns_resolver_set_edns_udp_size(res.get(), 1232);
    if (timeout_ms > 0)
    {
        timeval tv{};
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        ldns_resolver_set_timeout(res.get(), tv);
    }

    RdfPtr name(ldns_dname_new_frm_str(host.c_str()));
    if (!name) return failed(RawDnsErrorKind::InvalidQname, "invalid host name: " + host);

    RawDnsResult out{};
    bool answered = false;
    if (strategy != DnsStrategy::Ipv6Only)
        answered |= lookup(res.get(), name.get(), LDNS_RR_TYPE_A, out.addresses);
    if (strategy != DnsStrategy::Ipv4Only)
        answered |= lookup(res.get(), name.get(), LDNS_RR_TYPE_AAAA, out.addresses);

    if (!answered) return failed(RawDnsErrorKind::QueryFailed, "no reply from " + ns);
    if (out.addresses.empty())
        return failed(RawDnsErrorKind::NoAnswer, "no A/AAAA records for " + host);
    return out;
#endif
}
} // namespace hb
