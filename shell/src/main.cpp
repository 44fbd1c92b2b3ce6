#include "inverse_shell/app.hpp"

#include <cstdio>

int main(int argc, char** argv) {
		inverse_shell::Options opts{};
		const char* bad_arg = nullptr;
		switch (inverse_shell::parse_args(argc, argv, &opts, &bad_arg)) {
		case inverse_shell::ArgsStatus::Ok:
				break;
		case inverse_shell::ArgsStatus::Help:
				inverse_shell::print_usage(stdout);
				return 0;
		case inverse_shell::ArgsStatus::UnknownOption:
				std::fprintf(stderr, "%s: %s\n", inverse_shell::tr(inverse_shell::TextId::ErrUnknownOption), bad_arg);
				inverse_shell::print_usage(stderr);
				return static_cast<int>(inverse_shell::ExitCode::InputError);
		case inverse_shell::ArgsStatus::ExtraArgument:
				std::fprintf(stderr, "%s: %s\n", inverse_shell::tr(inverse_shell::TextId::ErrExtraArg), bad_arg);
				inverse_shell::print_usage(stderr);
				return static_cast<int>(inverse_shell::ExitCode::InputError);
		}

		static inverse_shell::App app{stdout, stderr};
		return app.run(opts);
}
