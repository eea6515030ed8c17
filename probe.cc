/************************************************************************/
/*                                                                      */
/*    lrvutil - convert EAC 360 degree video to dual fisheye LRV layout */
/*                                                                      */
/*            Copyright 2024 by Kay F. Jahnke                           */
/*                                                                      */
/*    The git repository for this software is at                        */
/*                                                                      */
/*    https://github.com/kfjahnke/envutil                               */
/*                                                                      */
/*    Please direct questions, bug reports, and contributions to        */
/*                                                                      */
/*    kfjahnke+envutil@gmail.com                                        */
/*                                                                      */
/*    Permission is hereby granted, free of charge, to any person       */
/*    obtaining a copy of this software and associated documentation    */
/*    files (the "Software"), to deal in the Software without           */
/*    restriction, including without limitation the rights to use,      */
/*    copy, modify, merge, publish, distribute, sublicense, and/or      */
/*    sell copies of the Software, and to permit persons to whom the    */
/*    Software is furnished to do so, subject to the following          */
/*    conditions:                                                       */
/*                                                                      */
/*    The above copyright notice and this permission notice shall be    */
/*    included in all copies or substantial portions of the             */
/*    Software.                                                         */
/*                                                                      */
/*    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND    */
/*    EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES   */
/*    OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND          */
/*    NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT       */
/*    HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,      */
/*    WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING      */
/*    FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR     */
/*    OTHER DEALINGS IN THE SOFTWARE.                                   */
/*                                                                      */
/************************************************************************/

#include <memory>
#include <mutex>

extern "C"
{
  #include <libavformat/avformat.h>
  #include <libavutil/avutil.h>
  #include <libavutil/error.h>
  #include <libavutil/log.h>
}

#include "probe.h"

namespace lrvutil
{

namespace
{
  // avformat_close_input wants the address of the pointer

  struct format_closer
  {
    void operator() ( AVFormatContext * p ) const
    {
      avformat_close_input ( &p ) ;
    }
  } ;

  typedef std::unique_ptr < AVFormatContext , format_closer > format_ptr ;

  std::string av_error_string ( int code )
  {
    char buffer [ AV_ERROR_MAX_STRING_SIZE ] = { 0 } ;
    av_strerror ( code , buffer , sizeof ( buffer ) ) ;
    return buffer ;
  }

  std::once_flag quiet_once ;
} ;

libav_probe_t::libav_probe_t()
{
  // libav's own console chatter would interleave with ours

  std::call_once ( quiet_once , [] { av_log_set_level ( AV_LOG_QUIET ) ; } ) ;
}

media_info_t libav_probe_t::probe ( const std::string & path ) const
{
  media_info_t info ;

  AVFormatContext * raw_ctx = nullptr ;
  int ret = avformat_open_input ( &raw_ctx , path.c_str() , nullptr , nullptr ) ;
  if ( ret < 0 )
  {
    info.error = "can't open " + path + ": " + av_error_string ( ret ) ;
    return info ;
  }

  format_ptr fmt_ctx ( raw_ctx ) ;

  ret = avformat_find_stream_info ( fmt_ctx.get() , nullptr ) ;
  if ( ret < 0 )
  {
    info.error = "no stream info in " + path + ": " + av_error_string ( ret ) ;
    return info ;
  }

  int video_index = av_find_best_stream ( fmt_ctx.get() , AVMEDIA_TYPE_VIDEO ,
                                          -1 , -1 , nullptr , 0 ) ;
  if ( video_index >= 0 )
  {
    const AVCodecParameters * par
      = fmt_ctx->streams [ video_index ] -> codecpar ;
    info.has_video = true ;
    info.width = par->width ;
    info.height = par->height ;
  }

  for ( unsigned int i = 0 ; i < fmt_ctx->nb_streams ; i++ )
  {
    if ( fmt_ctx->streams [ i ] -> codecpar -> codec_type
         == AVMEDIA_TYPE_AUDIO )
    {
      info.has_audio = true ;
      break ;
    }
  }

  if ( fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0 )
    info.duration = double ( fmt_ctx->duration ) / AV_TIME_BASE ;

  info.valid = true ;
  return info ;
}

} ; // namespace lrvutil
