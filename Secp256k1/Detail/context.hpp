#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 { namespace Detail {

/* The process-wide library context, created on first
 * use.  Illegal arguments passed to the library throw
 * std::invalid_argument out of the library call.  */
secp256k1_context_struct const* context();

}}

#endif /* SECP256K1_DETAIL_CONTEXT_HPP */
