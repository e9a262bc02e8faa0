#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"Node/Rpc.hpp"
#include"Rescue/Logger.hpp"
#include<assert.h>
#include<errno.h>
#include<fcntl.h>
#include<functional>
#include<sys/socket.h>
#include<sys/types.h>
#include<unistd.h>
#include<vector>

namespace {

std::string result(Jsmn::Object const& req, Json::Out res) {
	return Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("id", double(req["id"]))
			.field("result", res)
		.end_object()
		.output()
		;
}
std::string error(Jsmn::Object const& req, int code, std::string const& msg) {
	auto err = Json::Out()
		.start_object()
			.field("code", double(code))
			.field("message", msg)
		.end_object()
		;
	return Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("id", double(req["id"]))
			.field("error", err)
		.end_object()
		.output()
		;
}

/* Answers requests with whatever the handler gives back,
 * which may be nothing (hold the request) or several
 * responses at once.  */
class ScriptedServer {
private:
	Net::Fd socket;
	Jsmn::Parser parser;
	std::function<std::vector<std::string>(Jsmn::Object const&)> handler;

	Ev::Io<void> writeloop(std::string to_write) {
		return Ev::yield().then([this, to_write]() {
			if (!socket)
				return Ev::lift();
			auto res = write( socket.get()
					, to_write.c_str(), to_write.size()
					);
			if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
				return writeloop(to_write);
			assert(res > 0);
			if (std::size_t(res) < to_write.size())
				return writeloop(to_write.substr(res));
			return Ev::lift();
		});
	}

	Ev::Io<void> respond_all(std::vector<std::string> responses) {
		auto act = Ev::lift();
		for (auto const& r : responses)
			act += writeloop(r + "\n");
		return act;
	}

	/* Set by the handler to hang up after replying.  */
	bool& close_after_reply;

public:
	ScriptedServer( Net::Fd socket_
		      , std::function<std::vector<std::string>(Jsmn::Object const&)> handler_
		      , bool& close_after_reply_
		      ) : socket(std::move(socket_))
			, handler(std::move(handler_))
			, close_after_reply(close_after_reply_) {
		auto flags = fcntl(socket.get(), F_GETFL);
		flags |= O_NONBLOCK;
		fcntl(socket.get(), F_SETFL, flags);
	}

	Ev::Io<void> serve() {
		return Ev::yield().then([this]() {
			if (!socket)
				return Ev::lift();
			auto requests = std::vector<Jsmn::Object>();
			char buf[4096];
			for (;;) {
				auto res = read(socket.get(), buf, sizeof(buf));
				if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
					break;
				if (res <= 0) {
					socket.reset();
					return Ev::lift();
				}
				auto got = parser.feed(std::string(buf, std::size_t(res)));
				requests.insert(requests.end(), got.begin(), got.end());
			}
			auto act = Ev::lift();
			for (auto const& r : requests)
				act += respond_all(handler(r));
			return std::move(act).then([this]() {
				if (close_after_reply)
					socket.reset();
				return serve();
			});
		});
	}
};

}

int main() {
	auto logger = Rescue::Logger(Net::Fd(), Rescue::Trace);

	int sockets[2];
	auto res = socketpair(AF_UNIX, SOCK_STREAM, 0, sockets);
	assert(res >= 0);

	auto held = std::vector<Jsmn::Object>();
	auto hang_up = false;
	auto server = ScriptedServer(Net::Fd(sockets[0]), [&](Jsmn::Object const& req) {
		assert(std::string(req["jsonrpc"]) == "2.0");
		auto method = std::string(req["method"]);
		if (method == "big") {
			assert(req["params"]["arr"].size() == 10000);
			return std::vector<std::string>{
				result(req, Json::Out::empty_object())
			};
		}
		if (method == "bad")
			return std::vector<std::string>{
				error(req, -32600, "Some error")
			};
		if (method == "first" || method == "second") {
			/* Answer the pair in reverse order.  */
			held.push_back(req);
			if (held.size() < 2)
				return std::vector<std::string>();
			auto ret = std::vector<std::string>();
			for (auto it = held.rbegin(); it != held.rend(); ++it) {
				auto echo = Json::Out()
					.start_object()
						.field("method", std::string((*it)["method"]))
					.end_object()
					;
				ret.push_back(result(*it, echo));
			}
			held.clear();
			return ret;
		}
		/* Hang up without answering.  */
		hang_up = true;
		return std::vector<std::string>();
	}, hang_up);
	auto client = Node::Rpc(logger, Net::Fd(sockets[1]));

	auto succeeded = false;
	auto errored = false;
	auto pair_ok = 0;
	auto closed = false;
	auto closed_later = false;

	auto pair_command = [&](std::string const& m) {
		return client.command(m, Json::Out::empty_object())
			.then([&, m](Jsmn::Object r) {
			assert(std::string(r["method"]) == m);
			++pair_ok;
			return Ev::lift();
		});
	};

	auto client_code = Ev::lift().then([&]() {
		auto params = Json::Out();
		auto obj = params.start_object();
		auto arr = obj.start_array("arr");
		for (auto i = std::size_t(0); i < 10000; ++i)
			arr.entry((double)i);
		arr.end_array();
		obj.end_object();
		return client.command("big", params);
	}).then([&](Jsmn::Object r) {
		assert(r.is_object());
		succeeded = true;
		return client.command("bad", Json::Out::empty_object())
				.catching<Node::RpcError>([&](Node::RpcError const& e) {
			assert(e.command == "bad");
			assert(std::string(e.what()) == "bad: Some error");
			assert(double(e.error["code"]) == -32600);
			errored = true;
			return Ev::lift(Jsmn::Object());
		});
	}).then([&](Jsmn::Object) {
		return Ev::concurrent(pair_command("first"));
	}).then([&]() {
		return pair_command("second");
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		return client.command("hangup", Json::Out::empty_object(), true)
				.catching<Node::RpcClosed>([&](Node::RpcClosed const&) {
			closed = true;
			return Ev::lift(Jsmn::Object());
		});
	}).then([&](Jsmn::Object) {
		return client.command("after", Json::Out::empty_object())
				.catching<Node::RpcClosed>([&](Node::RpcClosed const&) {
			closed_later = true;
			return Ev::lift(Jsmn::Object());
		});
	}).then([](Jsmn::Object) {
		return Ev::lift(0);
	});

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(server.serve());
	}).then([&]() {
		return client_code;
	});

	auto ec = Ev::start(code);

	assert(succeeded);
	assert(errored);
	assert(pair_ok == 2);
	assert(closed);
	assert(closed_later);

	/* Shutting down from our side fails what is outstanding.  */
	{
		res = socketpair(AF_UNIX, SOCK_STREAM, 0, sockets);
		assert(res >= 0);
		auto never_hang_up = false;
		auto silent = ScriptedServer(Net::Fd(sockets[0]), [](Jsmn::Object const&) {
			return std::vector<std::string>();
		}, never_hang_up);
		auto c2 = Node::Rpc(logger, Net::Fd(sockets[1]));
		auto cancelled = false;
		auto code2 = Ev::lift().then([&]() {
			return Ev::concurrent(silent.serve());
		}).then([&]() {
			return Ev::concurrent(Ev::yield().then([&]() {
				c2.shutdown();
				return Ev::lift();
			}));
		}).then([&]() {
			return c2.command("never", Json::Out::empty_object());
		}).then([](Jsmn::Object) {
			return Ev::lift(1);
		}).catching<Node::RpcClosed>([&](Node::RpcClosed const&) {
			cancelled = true;
			return Ev::lift(0);
		});
		assert(Ev::start(code2) == 0);
		assert(cancelled);
	}

	return ec;
}
