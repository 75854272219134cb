#pragma once

#include <vsm/platform.h>

#if pollio_config_dynamic_library
#	if pollio_config_dynamic_library_export
#		define pollio_detail_api vsm_api_export
#	else
#		define pollio_detail_api vsm_api_import
#	endif
#else
#	define pollio_detail_api
#endif
