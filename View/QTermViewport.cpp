/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#include <qtermdoc/QTermViewport.hpp>
#include <qtermdoc/QTermDocument.hpp>

#include <cmath>

bool QTermViewport::fitsFrame( const QTermViewportState& state ) {
    return state.zoomPercent == 100 and not state.isPanned();
}


QSize QTermViewport::framePixels( const QTermViewportState& state, QSize cellPx ) {
    const int cw = qMax( 1, cellPx.width() );
    const int ch = qMax( 1, cellPx.height() );

    return QSize( qMax( 1, state.frameCols ) * cw, qMax( 1, state.frameRows ) * ch );
}


QTermRenderRequest QTermViewport::renderRequest( int page, QSizeF pageSizePt, const QTermViewportState& state, QSize cellPx,
                                                 const QTermViewportLimits& limits, QTermRenderOptions::ColorMode mode ) {
    QTermRenderRequest req;

    req.page      = page;
    req.colorMode = mode;

    const QSize viewport = framePixels( state, cellPx );

    qreal ratio = 1.0;

    if ( pageSizePt.width() > 0 and pageSizePt.height() > 0 ) {
        ratio = pageSizePt.width() / pageSizePt.height();
    }

    ratio = qBound( 0.05, ratio, 20.0 );

    /** Fit: use the full frame height and let the width follow the page aspect */
    qint64 baseWidth = viewport.width();

    if ( fitsFrame( state ) ) {
        const qint64 fitWidth = qMax<qint64>( 1, qRound64( viewport.height() * ratio ) );
        baseWidth = qMin<qint64>( viewport.width(), fitWidth );
    }

    qint64 width = baseWidth * qMax( 1, state.zoomPercent ) / 100;

    const qint64 widthByPixels = qMax<qint64>( 1, (qint64)std::floor( std::sqrt( (double)limits.maxRenderPixels * ratio ) ) );

    width = qMin<qint64>( width, limits.maxRenderWidth );
    width = qMin<qint64>( width, widthByPixels );
    width = qBound<qint64>( 1, width, QTERMDOC_MAX_RENDER_EDGE );

    qint64 height = qMax<qint64>( 1, qRound64( width / ratio ) );
    height = qMin<qint64>( height, QTERMDOC_MAX_RENDER_EDGE );

    req.width  = (int)width;
    req.height = (int)height;

    return req;
}


QTermPlacement QTermViewport::place( QSize bitmapSize, QTermViewportState& state, QSize cellPx, qint64 maxTransmitPixels ) {
    QTermPlacement placement;

    const int   cw       = qMax( 1, cellPx.width() );
    const int   ch       = qMax( 1, cellPx.height() );
    const QSize viewport = framePixels( state, cellPx );

    const int bmpW = qMax( 0, bitmapSize.width() );
    const int bmpH = qMax( 0, bitmapSize.height() );

    const int cropW = qMin( viewport.width(), bmpW );
    const int cropH = qMin( viewport.height(), bmpH );

    /** Clamp the pan so the crop never leaves the bitmap; the caller sees the result */
    state.panX = qBound( 0, state.panX, bmpW - cropW );
    state.panY = qBound( 0, state.panY, bmpH - cropH );

    placement.cropRect = QRect( state.panX, state.panY, cropW, cropH );

    if ( cropW == 0 or cropH == 0 ) {
        placement.transmitSize = QSize( 0, 0 );
        placement.targetCells  = centered( QSize( 0, 0 ), state.frameCols, state.frameRows );

        return placement;
    }

    /** Cells covered by the crop at full resolution, never more than the frame */
    const int cols = qBound( 1, (cropW + cw - 1) / cw, qMax( 1, state.frameCols ) );
    const int rows = qBound( 1, (cropH + ch - 1) / ch, qMax( 1, state.frameRows ) );

    placement.targetCells  = centered( QSize( cols, rows ), state.frameCols, state.frameRows );
    placement.transmitSize = fitToBudget( placement.cropRect.size(), maxTransmitPixels );

    return placement;
}


QSize QTermViewport::fitToBudget( QSize size, qint64 budget ) {
    const qint64 area = (qint64)size.width() * size.height();

    if ( budget <= 0 or area <= budget ) {
        return size;
    }

    const double scale = std::sqrt( (double)budget / (double)area );

    qint64 w = qMax<qint64>( 1, (qint64)std::floor( size.width() * scale ) );
    qint64 h = qMax<qint64>( 1, (qint64)std::floor( size.height() * scale ) );

    /** Floating point may still leave us a row over */
    while ( w * h > budget and (w > 1 or h > 1) ) {
        if ( w >= h ) {
            w--;
        }

        else {
            h--;
        }
    }

    return QSize( (int)w, (int)h );
}


QRect QTermViewport::centered( QSize cells, int frameCols, int frameRows ) {
    const int w = qBound( 0, cells.width(), qMax( 0, frameCols ) );
    const int h = qBound( 0, cells.height(), qMax( 0, frameRows ) );

    return QRect( (frameCols - w) / 2, (frameRows - h) / 2, w, h );
}


int QTermViewport::clampZoom( int zoom, const QTermViewportLimits& limits ) {
    return qBound( limits.minZoom, zoom, limits.maxZoom );
}
