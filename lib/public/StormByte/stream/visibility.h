#pragma once

#include <StormByte/platform.h>

#ifdef WINDOWS
	#ifdef StormByte_Stream_EXPORTS
		#define STORMBYTE_STREAM_PUBLIC	__declspec(dllexport)
	#else
		#define STORMBYTE_STREAM_PUBLIC	__declspec(dllimport)
	#endif
	#define STORMBYTE_STREAM_PRIVATE
#else
	#define STORMBYTE_STREAM_PUBLIC		__attribute__ ((visibility ("default")))
	#define STORMBYTE_STREAM_PRIVATE	__attribute__ ((visibility ("hidden")))
#endif
