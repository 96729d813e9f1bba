/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <google/protobuf/stubs/common.h>
#include <iostream>
#include <limits> // std::numeric_limits
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "analyze.hpp"
#include "export.hpp"
#include "metadata.hpp"
#include "print_header.hpp"
#include "rofl.hpp"

namespace
{

constexpr auto IOS_IN = std::ios_base::binary | std::ios_base::in;

auto print_usage(std::string_view exe) noexcept -> void
{
	std::cerr << "\nUsage: " << exe << " [--signature] [--header]"
			  << " [--payload] [--metadata] [--stats]"
			  << "\n       " << std::string(exe.length(), ' ')
			  << " [--metadata-key KEY] [--id] [--duration]"
			  << " [--chunk-count] [--keyframe-count]"
			  << "\n       " << std::string(exe.length(), ' ')
			  << " [--load-end-chunk] [--game-start-chunk]"
			  << " [--keyframe-interval] [--encryption-key]"
			  << "\n       " << std::string(exe.length(), ' ')
			  << " [--export-chunks] [--export-keyframes] [--export-dir DIR]"
			  << "\n       " << std::string(exe.length(), ' ')
			  << " [--analyze MODE] [--only KIND] [--type TYPE]"
			  << " [--segment ID]... [--verbose] REPLAY\n\n";
	std::cerr << "  --signature\t\tPrint the file signature (in hexadecimal).\n";
	std::cerr << "  --header\t\tPrint the file header fields.\n";
	std::cerr << "  --payload\t\tPrint the payload header fields.\n";
	std::cerr << "  --metadata\t\tPrint the game metadata JSON.\n";
	std::cerr << "  --stats\t\tPrint the \"statsJson\" metadata value.\n";
	std::cerr << "  --metadata-key KEY\tPrint the value of a metadata key.\n";
	std::cerr << "  --id\t\t\tPrint the game ID.\n";
	std::cerr << "  --duration\t\tPrint the game duration in milliseconds.\n";
	std::cerr << "  --chunk-count\t\tPrint the number of chunks.\n";
	std::cerr << "  --keyframe-count\tPrint the number of keyframes.\n";
	std::cerr << "  --load-end-chunk\tPrint the ID of the last loading "
				 "chunk.\n";
	std::cerr << "  --game-start-chunk\tPrint the ID of the first chunk "
				 "after the game's start.\n";
	std::cerr << "  --keyframe-interval\tPrint the keyframe interval in "
				 "milliseconds.\n";
	std::cerr << "  --encryption-key\tPrint the file's primary encryption "
				 "key.\n";
	std::cerr << "  --export-chunks\tExport chunk data to files.\n";
	std::cerr << "  --export-keyframes\tExport keyframe data to files.\n";
	std::cerr << "  --export-dir DIR\tExport directory (default: '.').\n";
	std::cerr << "  --analyze MODE\tPrint a JSON report on segment data, "
				 "MODE is one of\n\t\t\t'stats', 'detail', 'verify' or "
				 "'bytes'.\n";
	std::cerr << "  --only KIND\t\tAnalyze only 'chunk' or 'keyframe' "
				 "segments.\n";
	std::cerr << "  --type TYPE\t\tIn stats mode, count payload lengths of "
				 "sections of TYPE.\n";
	std::cerr << "  --segment ID\t\tRestrict export and analysis to segment "
				 "ID (repeatable).\n";
	std::cerr << "  --verbose\t\tPrint where segment data stopped "
				 "decoding.\n";
	std::cerr << "  REPLAY\t\tReplay file to parse (required).\n";
}

auto read_file(std::string_view exe, std::string_view fn) noexcept
	-> std::optional<std::vector<uint8_t>>
{
	std::fstream f(std::string(fn), IOS_IN);
	if(!f.is_open())
	{
		std::cerr << exe << ": Could not open file '" << fn << "'.\n";
		return std::nullopt;
	}
	f.ignore(std::numeric_limits<std::streamsize>::max());
	auto const filesize = static_cast<size_t>(f.gcount());
	f.clear();
	f.seekg(0, std::ios_base::beg);
	std::vector<uint8_t> buffer(filesize);
	f.read(reinterpret_cast<char*>(buffer.data()),
	       static_cast<std::streamsize>(filesize));
	if(static_cast<size_t>(f.gcount()) != filesize)
	{
		std::cerr << exe << ": Read error.\n";
		return std::nullopt;
	}
	return buffer;
}

auto parse_u32(std::string_view s) noexcept -> std::optional<uint32_t>
{
	uint32_t value{};
	auto const [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if(ec != std::errc{} || end != s.data() + s.size())
		return std::nullopt;
	return value;
}

auto parse_kind(std::string_view s) noexcept -> std::optional<SegmentKind>
{
	if(s == "chunk")
		return SEGMENT_CHUNK;
	if(s == "keyframe")
		return SEGMENT_KEYFRAME;
	return std::nullopt;
}

} // namespace

auto main(int argc, char* argv[]) -> int
{
	GOOGLE_PROTOBUF_VERIFY_VERSION;
	struct End
	{
		~End() { google::protobuf::ShutdownProtobufLibrary(); }
	} _;
	auto const exe = std::string_view{argv[0]};
	if(argc < 3)
	{
		std::cerr << exe << ": No input file or flags.\n";
		print_usage(exe);
		return EXIT_FAILURE;
	}
	bool print_signature_opt = false;
	bool print_header_opt = false;
	bool print_payload_opt = false;
	bool print_metadata_opt = false;
	bool print_stats_opt = false;
	std::optional<std::string_view> metadata_key;
	bool print_id_opt = false;
	bool print_duration_opt = false;
	bool print_chunk_count_opt = false;
	bool print_keyframe_count_opt = false;
	bool print_load_end_chunk_opt = false;
	bool print_game_start_chunk_opt = false;
	bool print_keyframe_interval_opt = false;
	bool print_encryption_key_opt = false;
	bool export_chunks_opt = false;
	bool export_keyframes_opt = false;
	std::filesystem::path export_dir{"."};
	std::optional<AnalyzeMode> analyze_mode;
	AnalyzeOptions options{};
	bool verbose_opt = false;
	auto const last_flag = argc - 1;
	for(int a = 1; a < last_flag; a++)
	{
		auto const arg = std::string_view{argv[a]};
		// Flags taking a value consume the next argument.
		auto value = [&]() -> std::optional<std::string_view>
		{
			if(a + 1 >= last_flag)
				return std::nullopt;
			return std::string_view{argv[++a]};
		};
		auto missing = [&]() -> int
		{
			std::cerr << exe << ": Missing or invalid value for '" << arg
					  << "'.\n";
			print_usage(exe);
			return EXIT_FAILURE;
		};
#define X(name, opt)   \
	if(arg == name)    \
	{                  \
		opt = true;    \
		continue;      \
	}
		X("--signature", print_signature_opt);
		X("--header", print_header_opt);
		X("--payload", print_payload_opt);
		X("--metadata", print_metadata_opt);
		X("--stats", print_stats_opt);
		X("--id", print_id_opt);
		X("--duration", print_duration_opt);
		X("--chunk-count", print_chunk_count_opt);
		X("--keyframe-count", print_keyframe_count_opt);
		X("--load-end-chunk", print_load_end_chunk_opt);
		X("--game-start-chunk", print_game_start_chunk_opt);
		X("--keyframe-interval", print_keyframe_interval_opt);
		X("--encryption-key", print_encryption_key_opt);
		X("--export-chunks", export_chunks_opt);
		X("--export-keyframes", export_keyframes_opt);
		X("--verbose", verbose_opt);
#undef X
		if(arg == "--metadata-key")
		{
			metadata_key = value();
			if(!metadata_key)
				return missing();
			continue;
		}
		if(arg == "--export-dir")
		{
			auto const v = value();
			if(!v)
				return missing();
			export_dir = std::filesystem::path{std::string(*v)};
			continue;
		}
		if(arg == "--analyze")
		{
			auto const v = value();
			if(!v || !(analyze_mode = parse_analyze_mode(*v)))
				return missing();
			options.mode = *analyze_mode;
			continue;
		}
		if(arg == "--only")
		{
			auto const v = value();
			if(!v || !(options.only = parse_kind(*v)))
				return missing();
			continue;
		}
		if(arg == "--type")
		{
			auto const v = value();
			if(!v || !(options.type = parse_u32(*v)))
				return missing();
			continue;
		}
		if(arg == "--segment")
		{
			auto const v = value();
			std::optional<uint32_t> id;
			if(!v || !(id = parse_u32(*v)))
				return missing();
			options.ids.emplace_back(*id);
			continue;
		}
		std::cerr << "Unrecognized option '" << arg << "'.\n";
		print_usage(exe);
		return EXIT_FAILURE;
	}
	auto const fn = std::string_view{argv[last_flag]};
	auto const content = read_file(exe, fn);
	if(!content)
		return EXIT_FAILURE; // NOTE: Error printed by `read_file`.
	auto parsed = parse_rofl(content->data(), content->size());
	if(parsed.error != RoflError::NONE)
	{
		std::cerr << exe << ": Not a rofl file: " << to_string(parsed.error)
				  << ".\n";
		return EXIT_FAILURE;
	}
	auto const& file = *parsed.file;
	if(print_signature_opt)
		print_signature(std::cout, file.head());
	if(print_header_opt)
		print_bin_header(std::cout, file.head());
	if(print_metadata_opt || print_stats_opt || metadata_key)
	{
		auto const metadata = file.metadata();
		if(metadata.error != RoflError::NONE)
		{
			std::cerr << exe << ": Cannot read metadata: "
					  << to_string(metadata.error) << ".\n";
			return EXIT_FAILURE;
		}
		if(print_metadata_opt)
			std::cout << metadata.json << '\n';
		auto print_key = [&](std::string_view key) -> bool
		{
			auto const r = metadata_value(metadata.json, key);
			if(r.error != RoflError::NONE)
			{
				std::cerr << exe << ": Cannot read metadata key '" << key
						  << "': " << to_string(r.error) << ".\n";
				return false;
			}
			std::cout << r.value << '\n';
			return true;
		};
		if(print_stats_opt && !print_key(METADATA_STATS_KEY))
			return EXIT_FAILURE;
		if(metadata_key && !print_key(*metadata_key))
			return EXIT_FAILURE;
	}
	bool const needs_segments =
		export_chunks_opt || export_keyframes_opt || analyze_mode;
	bool const needs_payload =
		print_payload_opt || print_id_opt || print_duration_opt ||
		print_chunk_count_opt || print_keyframe_count_opt ||
		print_load_end_chunk_opt || print_game_start_chunk_opt ||
		print_keyframe_interval_opt || print_encryption_key_opt ||
		needs_segments;
	if(!needs_payload)
		return EXIT_SUCCESS;
	auto const& payload = file.payload();
	if(payload.error != RoflError::NONE)
	{
		std::cerr << exe << ": Cannot read payload header: "
				  << to_string(payload.error) << ".\n";
		return EXIT_FAILURE;
	}
	auto const& p = payload.header;
	if(print_payload_opt)
		print_payload_header(std::cout, p);
	if(print_id_opt)
		std::cout << "ID: " << p.id() << '\n';
	if(print_duration_opt)
		std::cout << "Duration: " << p.duration() << " ms\n";
	if(print_chunk_count_opt)
		std::cout << "ChunkCount: " << p.chunk_count() << '\n';
	if(print_keyframe_count_opt)
		std::cout << "KeyframeCount: " << p.keyframe_count() << '\n';
	if(print_load_end_chunk_opt)
		std::cout << "LoadEndChunk: " << p.load_end_chunk() << '\n';
	if(print_game_start_chunk_opt)
		std::cout << "StartChunk: " << p.game_start_chunk() << '\n';
	if(print_keyframe_interval_opt)
		std::cout << "KeyframeInterval: " << p.keyframe_interval() << '\n';
	if(print_encryption_key_opt)
		std::cout << "EncryptionKey: " << p.encryption_key() << '\n';
	if(export_chunks_opt || export_keyframes_opt)
	{
		if(!ensure_directory(export_dir))
		{
			std::cerr << exe << ": Could not access nor create directory '"
					  << export_dir.string() << "'.\n";
			return EXIT_FAILURE;
		}
		auto export_options = options;
		if(export_chunks_opt != export_keyframes_opt)
			export_options.only =
				export_chunks_opt ? SEGMENT_CHUNK : SEGMENT_KEYFRAME;
		else
			export_options.only.reset();
		auto segments = file.segments(true);
		if(segments.error != RoflError::NONE)
		{
			std::cerr << exe << ": Cannot read segments: "
					  << to_string(segments.error) << ".\n";
			return EXIT_FAILURE;
		}
		auto& it = *segments.iterator;
		while(auto const segment = it.next())
		{
			if(!is_selected(export_options, *segment))
				continue;
			auto const r = export_segment(export_dir, p.id(), *segment);
			if(!r.success)
			{
				std::cerr << exe << ": An error occurred while writing to '"
						  << r.path.string() << "': " << r.error << ".\n";
				return EXIT_FAILURE;
			}
		}
		if(!it.is_valid())
		{
			std::cerr << exe << ": Segment table broke at offset "
					  << it.error_offset() << ": "
					  << to_string(it.last_error()) << ".\n";
			return EXIT_FAILURE;
		}
	}
	if(analyze_mode)
	{
		auto const r = analyze(file, options);
		if(r.error != RoflError::NONE)
		{
			std::cerr << exe << ": Cannot analyze segments: "
					  << to_string(r.error) << ".\n";
			return EXIT_FAILURE;
		}
		if(verbose_opt)
		{
			for(auto const& d : r.diagnostics)
				std::cerr << exe << ": " << d << ".\n";
		}
		std::cout << r.report << '\n';
	}
	return EXIT_SUCCESS;
}
