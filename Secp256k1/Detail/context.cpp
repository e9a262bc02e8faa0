#include"Secp256k1/Detail/context.hpp"
#include"Util/BacktraceException.hpp"
#include<secp256k1.h>
#include<stdexcept>
#include<string>

namespace {

void illegal_callback(char const* msg, void*) {
	throw Util::BacktraceException<std::invalid_argument>(
		std::string("secp256k1: ") + msg
	);
}

class Holder {
public:
	secp256k1_context* ctx;

	/* No signing or verification happens here, so
	 * no precomputed tables.  */
	Holder() : ctx(secp256k1_context_create(SECP256K1_CONTEXT_NONE)) {
		secp256k1_context_set_illegal_callback( ctx
						      , &illegal_callback
						      , nullptr
						      );
	}
	~Holder() {
		secp256k1_context_destroy(ctx);
	}
	Holder(Holder const&) =delete;
};

}

namespace Secp256k1 { namespace Detail {

secp256k1_context_struct const* context() {
	static Holder holder;
	return holder.ctx;
}

}}
